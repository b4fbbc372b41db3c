#pragma once
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Accumulates the analysis report as Markdown.
 * @details Sections are numbered in the order they are added. Tables with ten or
 * more columns are emitted as scrollable HTML, and tables longer than the preview
 * cap show the first rows with the full table folded into a details block.
 */
class ReportEngine {
public:
    static constexpr size_t kWideTableColumns = 10;
    static constexpr size_t kPreviewRows = 120;

    void addTitle(const std::string& title);
    // "## <n>. heading"
    void addSection(const std::string& heading);
    void addParagraph(const std::string& text);
    // Blockquote, used for notes that qualify a result.
    void addNote(const std::string& text);
    // Bold "Warnings:" line followed by one bullet per entry; nothing when empty.
    void addWarnings(const std::vector<std::string>& warnings);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);
    void addImage(const std::string& title, const std::string& imagePath);

    /**
     * @brief Writes the Markdown report; local image links are rewritten relative to the report directory.
     * @throws Psynet::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

    /**
     * @brief Converts a saved Markdown report to self-contained HTML with pandoc.
     * @post Returns the HTML path, or "" when pandoc is unavailable or fails (a warning is printed).
     */
    static std::string exportHtml(const std::string& markdownPath);

    std::string markdown() const { return body_.str(); }
    size_t sectionCount() const noexcept { return sections_; }

private:
    std::ostringstream body_;
    size_t sections_ = 0;
};
