#pragma once

#include "centy/progress.hpp"

#include <string>

namespace centy {

// Single-line download progress on stderr.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string last_label_;
    bool label_finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace centy
