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

#include "record_codec.h"
#include "config.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <sstream>
#include <stdexcept>

namespace duodb {
namespace persist {

namespace {

template <typename Writer>
void write_record(Writer& writer, const Record& r) {
    writer.StartObject();

    writer.Key(RecordCodec::kName);
    writer.String(r.name().c_str(), static_cast<rapidjson::SizeType>(r.name().size()));

    writer.Key(RecordCodec::kAge);
    writer.Int(r.age());

    writer.Key(RecordCodec::kId);
    const std::string id = to_string(r.id());
    writer.String(id.c_str(), static_cast<rapidjson::SizeType>(id.size()));

    writer.Key(RecordCodec::kTimeCreated);
    writer.String(r.created_at().c_str(), static_cast<rapidjson::SizeType>(r.created_at().size()));

    writer.EndObject();
}

template <typename Writer>
void write_array(Writer& writer, const std::vector<RecordPtr>& records) {
    writer.StartArray();
    for (const auto& r : records) {
        if (!r) {
            throw std::invalid_argument("Cannot encode a null record");
        }
        write_record(writer, *r);
    }
    writer.EndArray();
}

std::string field_error(size_t index, const char* field, const char* expected) {
    std::ostringstream oss;
    oss << "record #" << index << ": field \"" << field << "\" missing or not " << expected;
    return oss.str();
}

RecordPtr read_record(const rapidjson::Value& obj, size_t index) {
    if (!obj.IsObject()) {
        throw std::runtime_error("record #" + std::to_string(index) + ": expected a JSON object");
    }

    if (!obj.HasMember(RecordCodec::kId) || !obj[RecordCodec::kId].IsString()) {
        throw std::runtime_error(field_error(index, RecordCodec::kId, "a string"));
    }
    const std::string id_text = obj[RecordCodec::kId].GetString();
    auto id = parse_record_id(id_text);
    if (!id) {
        throw std::runtime_error("record #" + std::to_string(index) + ": invalid ID '" + id_text + "'");
    }

    if (!obj.HasMember(RecordCodec::kName) || !obj[RecordCodec::kName].IsString()) {
        throw std::runtime_error(field_error(index, RecordCodec::kName, "a string"));
    }
    const auto& name = obj[RecordCodec::kName];

    if (!obj.HasMember(RecordCodec::kAge) || !obj[RecordCodec::kAge].IsInt()) {
        throw std::runtime_error(field_error(index, RecordCodec::kAge, "an integer"));
    }

    if (!obj.HasMember(RecordCodec::kTimeCreated) || !obj[RecordCodec::kTimeCreated].IsString()) {
        throw std::runtime_error(field_error(index, RecordCodec::kTimeCreated, "a string"));
    }
    const auto& created = obj[RecordCodec::kTimeCreated];

    return std::make_shared<const Record>(*id,
                                          std::string(name.GetString(), name.GetStringLength()),
                                          obj[RecordCodec::kAge].GetInt(),
                                          std::string(created.GetString(), created.GetStringLength()));
}

void parse_document(rapidjson::Document& doc, const std::string& json) {
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "JSON parse error at offset " << doc.GetErrorOffset()
            << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        error() << oss.str();
        throw std::runtime_error(oss.str());
    }
}

} // namespace

std::string RecordCodec::encode(const std::vector<RecordPtr>& records, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', files::kJsonIndent);
        write_array(writer, records);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_array(writer, records);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::vector<RecordPtr> RecordCodec::decode(const std::string& json) {
    rapidjson::Document doc;
    parse_document(doc, json);

    if (!doc.IsArray()) {
        throw std::runtime_error("Record file must contain a JSON array");
    }

    std::vector<RecordPtr> out;
    out.reserve(doc.Size());
    for (rapidjson::SizeType i = 0; i < doc.Size(); i++) {
        out.push_back(read_record(doc[i], i));
    }
    return out;
}

std::string RecordCodec::encode_one(const Record& record, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', files::kJsonIndent);
        write_record(writer, record);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_record(writer, record);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

RecordPtr RecordCodec::decode_one(const std::string& json) {
    rapidjson::Document doc;
    parse_document(doc, json);
    return read_record(doc, 0);
}

} // namespace persist
} // namespace duodb
