#pragma once
#include <string>
#include <vector>

namespace TableScrape {

// Text collected for a single <td>/<th>.
//
// Two accumulators are fed by the same events: the raw buffer receives all
// text of the cell, the capture buffer receives the text of the first
// meaningful element (div, span, a, p, strong, em, b, i) opened inside the
// cell, until that element closes. A capture that closes blank is dropped and
// the next meaningful element gets a chance. The trimmed capture wins over
// the trimmed raw text whenever it is non-blank.
class CellContent {
public:
    static bool isMeaningfulTag(const std::string& tag);

    void openElement(const std::string& tag);
    void closeElement(const std::string& tag);
    void appendText(const std::string& text);

    std::string resolve() const;

    bool isCapturing() const { return captureDepth_ != 0; }
    bool hasCapture() const { return captureDone_; }
    size_t openElementCount() const { return openTags_.size(); }

private:
    void finishCapture();

    std::vector<std::string> openTags_;
    std::string rawText_;
    std::string capturedText_;
    size_t captureDepth_ = 0;   // stack depth of the capturing element, 0 when idle
    bool captureDone_ = false;
};

}
