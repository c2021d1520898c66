#include "centy/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace centy {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string cur_label(e.label);
    if (cur_label != last_label_) {
        label_finished_ = false;
        last_label_ = cur_label;
    }
    if (label_finished_) return;

    if (e.total > 0) {
        int pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100)
            pct = 100;
        std::fprintf(stderr,
                     "\r[%.*s] %3d%% (%llu/%llu bytes)",
                     (int)e.label.size(),
                     e.label.data(),
                     pct,
                     (unsigned long long)e.done,
                     (unsigned long long)e.total);
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %llu bytes",
                     (int)e.label.size(),
                     e.label.data(),
                     (unsigned long long)e.done);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.total > 0 && e.done >= e.total) {
        std::fprintf(stderr, "\n");
        label_finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace centy
