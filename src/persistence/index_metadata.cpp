/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "index_metadata.h"
#include "field_codec.h"
#include "errors.h"
#include <cstdio>

namespace xlease {
namespace persist {

namespace {

void put_be32(char* dst, uint32_t v) {
    dst[0] = static_cast<char>((v >> 24) & 0xff);
    dst[1] = static_cast<char>((v >> 16) & 0xff);
    dst[2] = static_cast<char>((v >> 8) & 0xff);
    dst[3] = static_cast<char>(v & 0xff);
}

uint32_t get_be32(const char* src) {
    const auto* p = reinterpret_cast<const unsigned char*>(src);
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

std::string IndexMetadata::bytes() const {
    field::check_name("lockspace", lockspace, index::kLockspaceSize);

    std::string out(layout::kMetadataSize, '\0');
    char* p = &out[0];
    put_be32(p + kMagicOffset, index::kMagic);
    p[4] = ':';
    if (!field::encode_decimal(p + kVersionOffset, version, kVersionDigits)) {
        throw std::invalid_argument("Version " + std::to_string(version) + " does not fit header");
    }
    p[9] = ':';
    field::encode_name(p + kLockspaceOffset, lockspace, index::kLockspaceSize);
    p[58] = ':';
    if (!field::encode_decimal(p + kMtimeOffset, mtime, index::kMtimeDigits)) {
        throw std::invalid_argument("Mtime " + std::to_string(mtime) + " does not fit header");
    }
    p[69] = ':';
    p[kUpdatingOffset] = updating ? 'u' : '-';
    p[71] = '\n';
    return out;
}

IndexMetadata IndexMetadata::decode(const char* data, size_t len) {
    if (len < kEncodedSize) {
        throw InvalidIndex("short header (" + std::to_string(len) + " bytes)");
    }
    uint32_t magic = get_be32(data + kMagicOffset);
    if (magic != index::kMagic) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%08x", magic);
        throw InvalidIndex(std::string("bad magic ") + buf);
    }
    if (data[4] != ':' || data[9] != ':' || data[58] != ':' || data[69] != ':' ||
        data[71] != '\n') {
        throw InvalidIndex("malformed header");
    }

    IndexMetadata md;
    uint64_t version = 0;
    if (!field::decode_decimal(data + kVersionOffset, kVersionDigits, &version)) {
        throw InvalidIndex("bad version");
    }
    md.version = static_cast<uint32_t>(version);

    if (!field::decode_name(data + kLockspaceOffset, index::kLockspaceSize, &md.lockspace) ||
        md.lockspace.empty()) {
        throw InvalidIndex("bad lockspace");
    }
    if (!field::decode_decimal(data + kMtimeOffset, index::kMtimeDigits, &md.mtime)) {
        throw InvalidIndex("bad mtime");
    }

    switch (data[kUpdatingOffset]) {
    case 'u':
        md.updating = true;
        break;
    case '-':
        md.updating = false;
        break;
    default:
        throw InvalidIndex("bad updating flag");
    }
    return md;
}

IndexMetadata IndexMetadata::from_bytes(const char* data, size_t len) {
    IndexMetadata md = decode(data, len);
    if (md.version != index::kVersion) {
        throw InvalidIndex("unsupported version " + std::to_string(md.version));
    }
    if (md.updating) {
        throw InvalidIndex("index is updating");
    }
    return md;
}

} // namespace persist
} // namespace xlease
