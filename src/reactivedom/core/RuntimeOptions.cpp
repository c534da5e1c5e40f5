#include <reactivedom/core/RuntimeOptions.hpp>
#include <reactivedom/reactive/CellRegistry.hpp>
#include <reactivedom/reactive/Scheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

namespace RD {
namespace {

auto trimmed(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr)
        return false;
    auto text = trimmed(value);
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text)
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

} // namespace

auto RuntimeOptions::fromEnvironment() -> Expected<RuntimeOptions> {
    RuntimeOptions options;
    if (char const* raw = std::getenv("REACTIVEDOM_MAX_FLUSH_ITERATIONS")) {
        auto        text  = trimmed(raw);
        std::size_t value = 0;
        auto [end, ec]    = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || end != text.data() + text.size() || value == 0) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "REACTIVEDOM_MAX_FLUSH_ITERATIONS must be a positive integer, got '"
                                             + std::string{raw} + "'"});
        }
        options.maxFlushIterations = value;
    }
    options.inspectCells = parse_truthy(std::getenv("REACTIVEDOM_INSPECT"));
    return options;
}

auto configureRuntime(RuntimeOptions const& options) -> void {
    Scheduler::current().setMaxFlushIterations(options.maxFlushIterations);
    CellRegistry::current().setEnabled(options.inspectCells);
    rd_log("runtime configured: maxFlushIterations=" + std::to_string(options.maxFlushIterations)
               + " inspectCells=" + (options.inspectCells ? "true" : "false"),
           "INFO");
}

} // namespace RD
