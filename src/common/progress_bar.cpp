#include "verifetch/common/progress_bar.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <sys/ioctl.h>
#include <unistd.h>

namespace verifetch {
namespace common {

ProgressBarRenderer::ProgressBarRenderer(const std::string& label, bool use_colors)
    : label_(label),
      use_colors_(use_colors),
      completed_(false),
      current_bytes_(0),
      bytes_per_sec_(0) {
}

void ProgressBarRenderer::update(std::optional<uint64_t> total_bytes, uint64_t current_bytes,
                                 uint64_t bytes_per_sec) {
    total_bytes_ = total_bytes;
    current_bytes_ = current_bytes;
    bytes_per_sec_ = bytes_per_sec;
}

void ProgressBarRenderer::complete() {
    completed_ = true;
}

void ProgressBarRenderer::clear(std::ostream& out) {
    if (!isatty(STDERR_FILENO)) return;
    out << "\r\033[K" << std::flush;
}

void ProgressBarRenderer::render(std::ostream& out) {
    if (!isatty(STDERR_FILENO)) {
        return;
    }

    if (completed_) {
        out << "\r\033[K" << std::flush;
        return;
    }

    out << "\r" << formatLine() << "\033[K" << std::flush;
}

std::string ProgressBarRenderer::formatLine() const {
    std::ostringstream oss;

    if (use_colors_) {
        oss << "\033[36m";
    }

    std::string label = label_;
    int max_label = std::max(10, getTerminalWidth() - 60);
    if (static_cast<int>(label.size()) > max_label) {
        label = "..." + label.substr(label.size() - static_cast<size_t>(max_label - 3));
    }

    if (total_bytes_ && *total_bytes_ > 0) {
        double progress = std::min(1.0, static_cast<double>(current_bytes_) / *total_bytes_);
        int percent = static_cast<int>(progress * 100);

        int bar_width = 20;
        int filled = static_cast<int>(bar_width * progress);

        oss << label << ": [";
        for (int i = 0; i < bar_width; ++i) {
            if (i < filled) {
                oss << "=";
            } else if (i == filled) {
                oss << ">";
            } else {
                oss << " ";
            }
        }
        oss << "] " << percent << "% ";

        if (use_colors_) {
            oss << "\033[0m";
        }

        oss << "(" << formatBytes(current_bytes_) << "/" << formatBytes(*total_bytes_) << ")";
    } else {
        oss << label << ": " << formatBytes(current_bytes_) << " downloaded";

        if (use_colors_) {
            oss << "\033[0m";
        }
    }

    if (bytes_per_sec_ > 0) {
        oss << " @ " << formatSpeed(static_cast<double>(bytes_per_sec_));
    }

    return oss.str();
}

std::string ProgressBarRenderer::formatBytes(uint64_t bytes) const {
    std::ostringstream oss;

    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " KB";
    } else if (bytes < 1024 * 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MB";
    } else {
        oss << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0 * 1024.0)) << " GB";
    }

    return oss.str();
}

std::string ProgressBarRenderer::formatSpeed(double bytes_per_sec) const {
    std::ostringstream oss;

    if (bytes_per_sec < 1024) {
        oss << std::fixed << std::setprecision(0) << bytes_per_sec << " B/s";
    } else if (bytes_per_sec < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes_per_sec / 1024.0) << " KB/s";
    } else {
        oss << std::fixed << std::setprecision(1) << (bytes_per_sec / (1024.0 * 1024.0)) << " MB/s";
    }

    return oss.str();
}

int ProgressBarRenderer::getTerminalWidth() const {
    struct winsize w;
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

}}
