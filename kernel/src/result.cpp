#include "exec_kernel/result.h"

namespace exec_kernel {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Byte offset where the code point with the given index starts, or npos.
size_t code_point_offset(const std::string& text, size_t index) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) continue; // continuation byte
        if (seen == index) return i;
        ++seen;
    }
    return std::string::npos;
}

} // anonymous namespace

std::string ResultAssembler::trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::string ResultAssembler::truncate(const std::string& text, size_t max_chars) {
    size_t cut = code_point_offset(text, max_chars);
    if (cut == std::string::npos) return text;
    return text.substr(0, cut) + "\n... (output truncated, exceeded " +
           std::to_string(max_chars) + " characters)";
}

ExecutionResult ResultAssembler::assemble(
    const ExecutionOutcome& outcome,
    bool capture_plots,
    size_t max_chars
) {
    if (outcome.timed_out) return timed_out();

    std::string output = trim(outcome.stdout_output);
    if (output.empty()) output = kNoOutput;

    std::string errors = trim(outcome.stderr_output);
    if (!errors.empty()) {
        output += kErrorsSeparator;
        output += errors;
    }

    if (capture_plots && !outcome.plot_files.empty()) {
        output += "\n\n" + std::to_string(outcome.plot_files.size()) + " plot(s) were generated.";
    }

    if (outcome.crashed) {
        output += "\n\nProcess terminated by signal " + std::to_string(outcome.term_signal) + ".";
    }

    return ExecutionResult{truncate(output, max_chars), std::nullopt};
}

ExecutionResult ResultAssembler::timed_out() {
    return ExecutionResult{kTimedOut, std::nullopt};
}

ExecutionResult ResultAssembler::no_code() {
    return ExecutionResult{kNoCode, std::nullopt};
}

ExecutionResult ResultAssembler::failure(const std::string& what) {
    return ExecutionResult{"", ExecutionError{kFailurePrefix + what}};
}

} // namespace exec_kernel
