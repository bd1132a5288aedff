#include "ClipboardState.hpp"


void ClipboardState::set(const std::vector<std::string>& paths, bool cut)
{
    paths_.clear();
    for (const auto& path : paths) {
        if (!path.empty()) {
            paths_.insert(path);
        }
    }
    if (paths_.empty()) {
        mode_ = ClipboardMode::Empty;
        return;
    }
    mode_ = cut ? ClipboardMode::Cut : ClipboardMode::Copy;
}


ClipboardContents ClipboardState::contents() const
{
    return ClipboardContents{mode_, std::vector<std::string>(paths_.begin(), paths_.end())};
}


void ClipboardState::clear()
{
    paths_.clear();
    mode_ = ClipboardMode::Empty;
}
