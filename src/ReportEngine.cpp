#include "ReportEngine.h"
#include "ProcessUtils.h"
#include "PsynetExceptions.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
namespace fs = std::filesystem;

using Rows = std::vector<std::vector<std::string>>;

std::string markdownCell(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        if (ch == '|') out += "\\|";
        else if (ch == '\n') out += "<br>";
        else if (ch != '\r') out.push_back(ch);
    }
    return out;
}

std::string htmlCell(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\n': out += "<br>"; break;
            case '\r': break;
            default: out.push_back(ch); break;
        }
    }
    return out;
}

const std::string& cellAt(const std::vector<std::string>& row, size_t i) {
    static const std::string empty;
    return i < row.size() ? row[i] : empty;
}

// Writes at most `limit` rows; short rows are padded with empty cells.
void writeMarkdownTable(std::ostream& out, const std::vector<std::string>& headers, const Rows& rows, size_t limit) {
    out << '|';
    for (const auto& h : headers) out << ' ' << markdownCell(h) << " |";
    out << "\n|";
    for (size_t i = 0; i < headers.size(); ++i) out << " --- |";
    out << '\n';
    for (size_t r = 0; r < std::min(limit, rows.size()); ++r) {
        out << '|';
        for (size_t i = 0; i < headers.size(); ++i) out << ' ' << markdownCell(cellAt(rows[r], i)) << " |";
        out << '\n';
    }
    out << '\n';
}

void writeHtmlTable(std::ostream& out, const std::vector<std::string>& headers, const Rows& rows, size_t limit) {
    out << "<div style=\"overflow-x:auto; max-width:100%;\">\n<table>\n  <thead>\n    <tr>\n";
    for (const auto& h : headers) out << "      <th>" << htmlCell(h) << "</th>\n";
    out << "    </tr>\n  </thead>\n  <tbody>\n";
    for (size_t r = 0; r < std::min(limit, rows.size()); ++r) {
        out << "    <tr>\n";
        for (size_t i = 0; i < headers.size(); ++i) out << "      <td>" << htmlCell(cellAt(rows[r], i)) << "</td>\n";
        out << "    </tr>\n";
    }
    out << "  </tbody>\n</table>\n</div>\n\n";
}

// scheme:... (http:, file:, data:) or #anchor
bool isNonLocalTarget(const std::string& target) {
    if (target.empty() || target[0] == '#') return true;
    const size_t colon = target.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    return std::all_of(target.begin(), target.begin() + static_cast<long>(colon), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '+' || ch == '-' || ch == '.';
    });
}

// Image paths are produced relative to the working directory (or absolute);
// the report needs them relative to its own directory.
std::string relinkTarget(const std::string& target, const fs::path& reportDir) {
    if (isNonLocalTarget(target)) return target;
    const size_t hash = target.find('#');
    const std::string file = target.substr(0, hash);
    const std::string fragment = hash == std::string::npos ? "" : target.substr(hash);
    if (file.empty()) return target;

    std::error_code ec;
    fs::path path(file);
    if (path.is_relative()) {
        if (fs::exists(reportDir / path, ec)) return path.generic_string() + fragment;
        path = fs::absolute(path, ec);
        if (ec) return target;
    }
    const fs::path rel = fs::proximate(path, fs::absolute(reportDir, ec), ec);
    if (ec || rel.empty()) return fs::path(file).generic_string() + fragment;
    return rel.generic_string() + fragment;
}

std::string relinkMarkdown(const std::string& markdown, const fs::path& reportDir) {
    std::string out;
    out.reserve(markdown.size());
    size_t cursor = 0;
    for (size_t open = markdown.find("](", cursor); open != std::string::npos; open = markdown.find("](", cursor)) {
        const size_t start = open + 2;
        const size_t close = markdown.find(')', start);
        if (close == std::string::npos) break;
        out.append(markdown, cursor, start - cursor);
        out += relinkTarget(markdown.substr(start, close - start), reportDir);
        out.push_back(')');
        cursor = close + 1;
    }
    out.append(markdown, cursor, std::string::npos);
    return out;
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ << "# " << title << "\n\n";
}

void ReportEngine::addSection(const std::string& heading) {
    body_ << "## " << ++sections_ << ". " << heading << "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ << text << "\n\n";
}

void ReportEngine::addNote(const std::string& text) {
    body_ << "> " << text << "\n\n";
}

void ReportEngine::addWarnings(const std::vector<std::string>& warnings) {
    if (warnings.empty()) return;
    body_ << "**Warnings:**\n\n";
    for (const auto& w : warnings) body_ << "- " << w << '\n';
    body_ << '\n';
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ << "### " << title << "\n\n";
    if (headers.empty()) {
        body_ << "(no columns)\n\n";
        return;
    }

    const bool wide = headers.size() >= kWideTableColumns;
    const bool tall = rows.size() > kPreviewRows;
    auto write = [&](size_t limit) {
        if (wide) writeHtmlTable(body_, headers, rows, limit);
        else writeMarkdownTable(body_, headers, rows, limit);
    };

    if (tall) {
        body_ << "_Showing " << kPreviewRows << " of " << rows.size() << " rows._\n\n";
    }
    write(tall ? kPreviewRows : rows.size());
    if (tall) {
        body_ << "<details>\n<summary>Show all " << rows.size() << " rows</summary>\n\n";
        write(rows.size());
        body_ << "</details>\n\n";
    }
}

void ReportEngine::addImage(const std::string& title, const std::string& imagePath) {
    body_ << "#### " << title << "\n\n![" << title << "](" << imagePath << ")\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    fs::path reportDir = fs::path(filePath).parent_path();
    if (reportDir.empty()) reportDir = ".";

    std::ofstream out(filePath);
    if (!out) throw Psynet::IOException("Cannot write report file: " + filePath);
    out << relinkMarkdown(body_.str(), reportDir);
    out.flush();
    if (!out.good()) throw Psynet::IOException("Failed while writing report file: " + filePath);
}

std::string ReportEngine::exportHtml(const std::string& markdownPath) {
    const std::string pandoc = ProcessUtils::findExecutableInPath("pandoc");
    if (pandoc.empty()) {
        std::cerr << "[Psynet][Warning] HTML export requested but pandoc was not found in PATH; only the Markdown report was written\n";
        return "";
    }

    const std::string htmlPath = fs::path(markdownPath).replace_extension(".html").string();
    std::vector<std::string> args = {markdownPath, "-o", htmlPath, "--standalone", "--self-contained",
                                     "--metadata", "title=Psynet report"};
    // Images are linked relative to the report, not to pandoc's working directory.
    const fs::path reportDir = fs::path(markdownPath).parent_path();
    if (!reportDir.empty()) args.push_back("--resource-path=" + reportDir.string());

    const int rc = ProcessUtils::spawnAndWait(pandoc, args);
    if (rc != 0) {
        std::cerr << "[Psynet][Warning] HTML export failed (pandoc exit code " << rc << ")\n";
        return "";
    }
    return htmlPath;
}
