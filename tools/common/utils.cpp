// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

namespace {

std::string to_json(const rapidjson::Document &doc)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return {buffer.GetString(), buffer.GetSize()};
}

rapidjson::Value to_value(std::string_view str, rapidjson::Document::AllocatorType &alloc)
{
    return rapidjson::Value{str.data(), static_cast<rapidjson::SizeType>(str.size()), alloc};
}

} // namespace

const char *level_to_str(DOCVAL_LOG_LEVEL level)
{
    switch (level) {
    case DOCVAL_LOG_TRACE:
        return "trace";
    case DOCVAL_LOG_DEBUG:
        return "debug";
    case DOCVAL_LOG_ERROR:
        return "error";
    case DOCVAL_LOG_WARN:
        return "warn";
    case DOCVAL_LOG_INFO:
        return "info";
    case DOCVAL_LOG_OFF:
        break;
    }

    return "off";
}

void log_cb(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t length)
{
    fprintf(stderr, "[%s][%s:%s:%u]: %s\n", level_to_str(level), file, function, line, message);
}

std::string verdict_to_json(
    std::string_view document, std::string_view input, const docval::validation_result &res)
{
    rapidjson::Document doc;
    doc.SetObject();
    auto &alloc = doc.GetAllocator();

    doc.AddMember("document", to_value(document, alloc), alloc);
    doc.AddMember("input", to_value(input, alloc), alloc);
    doc.AddMember("valid", res.ok(), alloc);
    if (!res) {
        doc.AddMember("error", to_value(docval::to_string(res.error()), alloc), alloc);
        doc.AddMember("message", to_value(docval::describe(res.error()), alloc), alloc);
    }

    return to_json(doc);
}

std::string matches_to_json(std::string_view document, std::string_view input,
    const std::vector<std::string_view> &matches)
{
    rapidjson::Document doc;
    doc.SetObject();
    auto &alloc = doc.GetAllocator();

    doc.AddMember("document", to_value(document, alloc), alloc);
    doc.AddMember("input", to_value(input, alloc), alloc);

    rapidjson::Value array{rapidjson::kArrayType};
    for (auto match : matches) { array.PushBack(to_value(match, alloc), alloc); }
    doc.AddMember("matches", array, alloc);

    return to_json(doc);
}
