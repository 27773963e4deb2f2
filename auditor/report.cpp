#include "auditor/report.h"

#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace StrictKit::Audit {

Report aggregate(std::vector<Finding> findings, ReportMetadata meta) {
    Report report;
    report.meta = std::move(meta);
    report.findings = std::move(findings);

    for (const auto& finding : report.findings) {
        ++report.summary.total;
        switch (finding.status) {
            case GateStatus::PASS: ++report.summary.passed; break;
            case GateStatus::FAIL: ++report.summary.failed; break;
            case GateStatus::WARN: ++report.summary.warned; break;
        }
    }

    report.success = report.summary.failed == 0;
    return report;
}

std::vector<std::string> brokenRuleIds(const Report& report) {
    std::vector<std::string> ids;
    for (const auto& finding : report.findings) {
        if (finding.status != GateStatus::PASS) {
            ids.emplace_back(doctrineFor(finding.gate).doctrine_id);
        }
    }
    return ids;
}

// ========== JSON Export ==========

namespace {

template <typename WriterT>
void writeReport(WriterT& w, const Report& report) {
    w.StartObject();

    w.Key("meta");
    w.StartObject();
    w.Key("tool");      w.String(report.meta.tool_name.c_str());
    w.Key("version");   w.String(report.meta.version.c_str());
    w.Key("timestamp"); w.String(report.meta.timestamp.c_str());
    w.Key("path");      w.String(report.meta.root_path.c_str());
    w.EndObject();

    w.Key("summary");
    w.StartObject();
    w.Key("total");  w.Uint(report.summary.total);
    w.Key("passed"); w.Uint(report.summary.passed);
    w.Key("failed"); w.Uint(report.summary.failed);
    w.Key("warned"); w.Uint(report.summary.warned);
    w.EndObject();

    w.Key("results");
    w.StartArray();
    for (const auto& finding : report.findings) {
        const GateDoctrine& doc = doctrineFor(finding.gate);
        w.StartObject();
        w.Key("id");      w.String(doc.doctrine_id);
        w.Key("gate");    w.String(doc.name);
        w.Key("status");  w.String(statusToString(finding.status));
        w.Key("message"); w.String(finding.message.c_str());
        if (finding.count) {
            w.Key("count");
            w.Uint(*finding.count);
        }
        if (finding.affected_files) {
            w.Key("files");
            w.Uint(*finding.affected_files);
        }
        w.EndObject();
    }
    w.EndArray();

    w.Key("success"); w.Bool(report.success);
    w.EndObject();
}

} // namespace

std::string toJson(const Report& report, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        writeReport(writer, report);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        writeReport(writer, report);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ========== Text Rendering ==========

std::string toText(const Report& report) {
    std::string out;
    char line[128];

    // Fixed-width prefix; the message is appended whole
    for (const auto& finding : report.findings) {
        const GateDoctrine& doc = doctrineFor(finding.gate);
        snprintf(line, sizeof(line), "%-5s [%s] %-9s: ",
                 statusToString(finding.status), doc.doctrine_id, doc.name);
        out += line;
        out += finding.message;
        out += '\n';
    }

    snprintf(line, sizeof(line), "\nGates: %u total, %u passed, %u failed, %u warned\n",
             report.summary.total, report.summary.passed,
             report.summary.failed, report.summary.warned);
    out += line;

    out += report.success ? "Conclusion: Project meets StrictKit standards.\n"
                          : "Conclusion: Project violates the StrictKit Baseline.\n";
    return out;
}

// ========== JUnit Export ==========

size_t xmlEscape(const char* in, char* out, size_t out_size) noexcept {
    if (out_size == 0) return 0;

    size_t pos = 0;
    for (const char* p = in; *p; ++p) {
        const char* entity = nullptr;
        switch (*p) {
            case '&':  entity = "&amp;"; break;
            case '<':  entity = "&lt;"; break;
            case '>':  entity = "&gt;"; break;
            case '"':  entity = "&quot;"; break;
            case '\'': entity = "&apos;"; break;
            default: break;
        }

        if (entity) {
            const size_t n = std::strlen(entity);
            if (pos + n >= out_size) break;
            std::memcpy(out + pos, entity, n);
            pos += n;
        } else {
            if (pos + 1 >= out_size) break;
            out[pos++] = *p;
        }
    }
    out[pos] = '\0';
    return pos;
}

namespace {

bool writeAll(int fd, const char* data, int len) noexcept {
    if (len < 0) return false;
    return write(fd, data, static_cast<size_t>(len)) == len;
}

} // namespace

bool writeJUnit(const Report& report, const char* path) noexcept {
    int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) return false;

    char buffer[4096];
    char escaped[2048];
    int len;

    len = snprintf(buffer, sizeof(buffer),
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<testsuite name=\"StrictKit\" tests=\"%u\" failures=\"%u\" skipped=\"%u\">\n",
        report.summary.total, report.summary.failed, report.summary.warned);
    if (!writeAll(fd, buffer, len)) {
        close(fd);
        return false;
    }

    for (const auto& finding : report.findings) {
        const GateDoctrine& doc = doctrineFor(finding.gate);
        xmlEscape(finding.message.c_str(), escaped, sizeof(escaped));

        switch (finding.status) {
            case GateStatus::PASS:
                len = snprintf(buffer, sizeof(buffer),
                    "  <testcase name=\"%s\" classname=\"StrictKit.%s\"/>\n",
                    doc.doctrine_id, doc.name);
                break;
            case GateStatus::FAIL:
                len = snprintf(buffer, sizeof(buffer),
                    "  <testcase name=\"%s\" classname=\"StrictKit.%s\">\n"
                    "    <failure message=\"%s\">%s</failure>\n"
                    "  </testcase>\n",
                    doc.doctrine_id, doc.name, escaped, doc.fix);
                break;
            case GateStatus::WARN:
                len = snprintf(buffer, sizeof(buffer),
                    "  <testcase name=\"%s\" classname=\"StrictKit.%s\">\n"
                    "    <skipped message=\"%s\"/>\n"
                    "  </testcase>\n",
                    doc.doctrine_id, doc.name, escaped);
                break;
        }

        if (len >= static_cast<int>(sizeof(buffer))) len = static_cast<int>(sizeof(buffer)) - 1;
        if (!writeAll(fd, buffer, len)) {
            close(fd);
            return false;
        }
    }

    len = snprintf(buffer, sizeof(buffer), "</testsuite>\n");
    if (!writeAll(fd, buffer, len)) {
        close(fd);
        return false;
    }

    return close(fd) == 0;
}

} // namespace StrictKit::Audit
