#ifndef CLIPBOARD_STATE_HPP
#define CLIPBOARD_STATE_HPP

#include "Types.hpp"

#include <set>
#include <string>
#include <vector>

struct ClipboardContents {
    ClipboardMode mode{ClipboardMode::Empty};
    std::vector<std::string> paths;
};

// Pending copy/cut selection. Pure state; no file system access.
class ClipboardState {
public:
    void set(const std::vector<std::string>& paths, bool cut);
    ClipboardContents contents() const;
    void clear();

    bool has_content() const { return mode_ != ClipboardMode::Empty; }
    ClipboardMode mode() const { return mode_; }

private:
    ClipboardMode mode_{ClipboardMode::Empty};
    std::set<std::string> paths_;
};

#endif
