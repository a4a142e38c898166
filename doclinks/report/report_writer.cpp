#include "report_writer.h"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace DocLinks {

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void writeString(JsonWriter& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void writeFindings(JsonWriter& writer, const char* key, const std::vector<Finding>& findings, bool with_depth) {
    writer.Key(key);
    writer.StartArray();
    for (const auto& f : findings) {
        writer.StartObject();
        writer.Key("file");
        writeString(writer, f.file);
        writer.Key("line");
        writer.Uint(f.line);
        writer.Key("link");
        writeString(writer, f.link);
        if (with_depth) {
            writer.Key("depth");
            writer.Uint(f.depth);
        } else {
            writer.Key("type");
            writeString(writer, f.type);
        }
        writer.EndObject();
    }
    writer.EndArray();
}

void writeArea(JsonWriter& writer, const AreaResult& area) {
    const RunStatistics& s = area.stats;

    writer.StartObject();
    writer.Key("summary");
    writer.StartObject();
    writer.Key("area");
    writeString(writer, area.name);
    writer.Key("total_files");        writer.Uint(s.total_files);
    writer.Key("total_links");        writer.Uint(s.total_links);
    writer.Key("internal_links");     writer.Uint(s.internal_links);
    writer.Key("external_links");     writer.Uint(s.external_links);
    writer.Key("valid_links");        writer.Uint(s.valid_links);
    writer.Key("broken_links");       writer.Uint(s.broken_links);
    writer.Key("warnings");           writer.Uint(s.warnings);
    writer.Key("deep_path_warnings"); writer.Uint(s.deep_path_warnings);
    writer.Key("auto_todo_fixes");    writer.Uint(s.auto_todo_fixes);
    writer.Key("batch_fixes");        writer.Uint(s.batch_fixes);
    writer.Key("success_rate");       writer.Uint(s.successRate());
    writer.EndObject();

    writeFindings(writer, "broken_links", area.broken, false);
    writeFindings(writer, "warnings", area.warnings, false);
    writeFindings(writer, "deep_paths", area.deep_paths, true);
    writer.EndObject();
}

} // namespace

auto ReportWriter::writeHeader(FILE* out, const std::string& area_name) const -> void {
    std::fprintf(out, "========================================\n");
    std::fprintf(out, "Link Validation Report - %s\n", area_name.c_str());
    std::fprintf(out, "========================================\n");
    std::fprintf(out, "\n");
}

auto ReportWriter::writeTextSummary(FILE* out, const RunStatistics& s) const -> void {
    std::fprintf(out, "\n");
    std::fprintf(out, "========================================\n");
    std::fprintf(out, "Summary\n");
    std::fprintf(out, "========================================\n");
    std::fprintf(out, "Total files scanned: %u\n", s.total_files);
    std::fprintf(out, "Total links found: %u\n", s.total_links);

    if (s.internal_links > 0 || s.external_links > 0) {
        std::fprintf(out, "  Internal links: %u\n", s.internal_links);
        std::fprintf(out, "  External links: %u\n", s.external_links);
    }

    std::fprintf(out, "Valid links: %u\n", s.valid_links);

    if (s.valid_internal > 0 || s.valid_external > 0) {
        std::fprintf(out, "  Internal valid: %u\n", s.valid_internal);
        std::fprintf(out, "  External valid: %u\n", s.valid_external);
    }

    std::fprintf(out, "Broken links: %u\n", s.broken_links);
    if (s.warnings > 0) std::fprintf(out, "Warnings: %u\n", s.warnings);
    if (s.deep_path_warnings > 0) std::fprintf(out, "Deep path warnings: %u\n", s.deep_path_warnings);
    if (s.auto_todo_fixes > 0) std::fprintf(out, "Auto-TODO fixes: %u\n", s.auto_todo_fixes);
    if (s.batch_fixes > 0) std::fprintf(out, "Batch fixes: %u\n", s.batch_fixes);

    if (s.total_links > 0) {
        std::fprintf(out, "Success rate: %u%%\n", s.successRate());
    }

    std::fprintf(out, "========================================\n");
}

auto ReportWriter::writeAreaResult(FILE* out, const AreaResult& area) const -> void {
    if (area.stats.broken_links > 0) {
        std::fprintf(out, "    %s\xE2\x9C\x97 %u broken links%s\n", palette_.red, area.stats.broken_links, palette_.nc);
    } else {
        std::fprintf(out, "    %s\xE2\x9C\x93 All %u links valid%s\n", palette_.green, area.stats.total_links, palette_.nc);
    }
    std::fprintf(out, "\n");
}

auto ReportWriter::writeMultiAreaSummary(FILE* out, const std::vector<AreaResult>& areas) const -> uint32_t {
    uint32_t failed_areas = 0;
    uint32_t total_broken = 0;
    for (const auto& area : areas) {
        if (area.stats.broken_links > 0) {
            ++failed_areas;
            total_broken += area.stats.broken_links;
        }
    }

    std::fprintf(out, "%s========================================%s\n", palette_.blue, palette_.nc);
    std::fprintf(out, "%s Final Summary%s\n", palette_.blue, palette_.nc);
    std::fprintf(out, "%s========================================%s\n", palette_.blue, palette_.nc);
    std::fprintf(out, "Areas validated: %zu\n", areas.size());
    std::fprintf(out, "Areas with errors: %u\n", failed_areas);
    std::fprintf(out, "Total broken links: %u\n", total_broken);
    std::fprintf(out, "\n");

    if (failed_areas == 0) {
        std::fprintf(out, "%s\xE2\x9C\x93 All areas validated successfully!%s\n", palette_.green, palette_.nc);
    } else {
        std::fprintf(out, "%s\xE2\x9C\x97 %u area(s) have broken links%s\n", palette_.red, failed_areas, palette_.nc);
    }
    return failed_areas;
}

auto ReportWriter::toJson(const std::vector<AreaResult>& areas) -> std::string {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.SetIndent(' ', 2);

    if (areas.size() == 1) {
        writeArea(writer, areas.front());
    } else {
        writer.StartObject();
        writer.Key("areas");
        writer.StartArray();
        for (const auto& area : areas) {
            writeArea(writer, area);
        }
        writer.EndArray();
        writer.EndObject();
    }

    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace DocLinks
