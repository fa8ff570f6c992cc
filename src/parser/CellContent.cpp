#include "parser/CellContent.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <iterator>
#include <set>

namespace TableScrape {

namespace {

const std::set<std::string> kMeaningfulTags = {
    "div", "span", "a", "p", "strong", "em", "b", "i"
};

}

bool CellContent::isMeaningfulTag(const std::string& tag) {
    return kMeaningfulTags.count(tag) > 0;
}

void CellContent::openElement(const std::string& tag) {
    openTags_.push_back(tag);
    if (!captureDone_ && captureDepth_ == 0) {
        captureDepth_ = openTags_.size();
        capturedText_.clear();
    }
}

void CellContent::closeElement(const std::string& tag) {
    auto it = std::find(openTags_.rbegin(), openTags_.rend(), tag);
    if (it == openTags_.rend()) return;

    // Closing an outer element implicitly closes everything opened inside it.
    openTags_.erase(std::next(it).base(), openTags_.end());
    if (captureDepth_ > openTags_.size()) finishCapture();
}

void CellContent::appendText(const std::string& text) {
    rawText_ += text;
    if (captureDepth_ != 0) capturedText_ += text;
}

void CellContent::finishCapture() {
    captureDepth_ = 0;
    if (isBlank(capturedText_)) {
        capturedText_.clear();
        return;
    }
    captureDone_ = true;
}

std::string CellContent::resolve() const {
    // A capture still open when the cell ends counts as finished.
    std::string captured = trim(capturedText_);
    if (!captured.empty()) return captured;
    return trim(rawText_);
}

}
