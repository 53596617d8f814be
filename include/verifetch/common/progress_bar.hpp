#pragma once

#include <string>
#include <optional>
#include <ostream>
#include <cstdint>

namespace verifetch {
namespace common {

class ProgressBarRenderer {
public:
    explicit ProgressBarRenderer(const std::string& label, bool use_colors = true);

    void update(std::optional<uint64_t> total_bytes, uint64_t current_bytes, uint64_t bytes_per_sec);
    void complete();
    void clear(std::ostream& out);

    void render(std::ostream& out);

    bool isComplete() const { return completed_; }

    std::string formatLine() const;

private:
    std::string label_;
    bool use_colors_;
    bool completed_;

    std::optional<uint64_t> total_bytes_;
    uint64_t current_bytes_;
    uint64_t bytes_per_sec_;

    std::string formatBytes(uint64_t bytes) const;
    std::string formatSpeed(double bytes_per_sec) const;
    int getTerminalWidth() const;
};

}}
