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

#include "record.h"
#include "field_codec.h"
#include "errors.h"

namespace xlease {
namespace persist {

std::string Record::bytes() const {
    std::string out(layout::kRecordSize, '\0');
    if (free()) {
        return out;
    }
    field::check_name("resource", resource, index::kResourceSize);

    char* p = &out[0];
    field::encode_name(p, resource, index::kResourceSize);
    p[48] = ':';
    p[kUpdatingOffset] = updating ? 'u' : '-';
    p[50] = ':';
    if (!field::encode_decimal(p + kModifiedOffset, modified, index::kMtimeDigits)) {
        throw std::invalid_argument("Modified time " + std::to_string(modified) +
                                    " does not fit record");
    }
    p[61] = ':';
    p[62] = ' ';
    p[63] = '\n';
    return out;
}

Record Record::from_bytes(const char* data) {
    bool zero = true;
    for (size_t i = 0; i < layout::kRecordSize; ++i) {
        if (data[i] != '\0') {
            zero = false;
            break;
        }
    }
    if (zero) {
        return Record();
    }

    if (data[48] != ':' || data[50] != ':' || data[61] != ':' || data[62] != ' ' ||
        data[63] != '\n') {
        throw InvalidRecord("malformed record");
    }

    Record rec;
    if (!field::decode_name(data, index::kResourceSize, &rec.resource) || rec.resource.empty()) {
        throw InvalidRecord("bad resource");
    }
    switch (data[kUpdatingOffset]) {
    case 'u':
        rec.updating = true;
        break;
    case '-':
        rec.updating = false;
        break;
    default:
        throw InvalidRecord("bad updating flag for " + rec.resource);
    }
    if (!field::decode_decimal(data + kModifiedOffset, index::kMtimeDigits, &rec.modified)) {
        throw InvalidRecord("bad modified time for " + rec.resource);
    }
    return rec;
}

} // namespace persist
} // namespace xlease
