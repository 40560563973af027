#include "drill_link/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace drill_link {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_logger_name[] = "drill_link";
constexpr char k_log_file_name[] = "drill_link.log";
constexpr char k_console_pattern[] = "[%l] %v";
/** `%J` is the JSON-escaped message; see JsonEscapedMessageFlag. */
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":"%J"})";

/**
 * @brief Pattern flag writing the log message as the body of a JSON string.
 *
 * Messages routinely quote raw broker payloads and HTTP bodies, which would
 * otherwise break the one-object-per-line file format.
 */
class JsonEscapedMessageFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& message, const std::tm&, spdlog::memory_buf_t& destination) override {
        const std::string_view text{message.payload.data(), message.payload.size()};
        for (const char character : text) {
            switch (character) {
                case '"':
                    append(destination, "\\\"");
                    break;
                case '\\':
                    append(destination, "\\\\");
                    break;
                case '\n':
                    append(destination, "\\n");
                    break;
                case '\r':
                    append(destination, "\\r");
                    break;
                case '\t':
                    append(destination, "\\t");
                    break;
                default:
                    if (static_cast<unsigned char>(character) < 0x20) {
                        fmt::format_to(std::back_inserter(destination), "\\u{:04x}", static_cast<unsigned>(character));
                    } else {
                        destination.push_back(character);
                    }
            }
        }
    }

    [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonEscapedMessageFlag>();
    }

  private:
    static void append(spdlog::memory_buf_t& destination, std::string_view text) {
        destination.append(text.data(), text.data() + text.size());
    }
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return text;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_dir{log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(k_console_pattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (path_log_dir / k_log_file_name).string(),
                k_max_file_size_bytes,
                k_max_files
            );
            auto file_formatter = std::make_unique<spdlog::pattern_formatter>();
            file_formatter->add_flag<JsonEscapedMessageFlag>('J').set_pattern(k_file_pattern);
            file_sink->set_formatter(std::move(file_formatter));

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(spdlog::level::info);
            // Remote failures are reported at warn.
            shared_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(shared_logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const std::string str_normalized = lowercase(str_level);
    // from_str maps unknown names to "off" rather than throwing.
    const auto level = spdlog::level::from_str(str_normalized);
    if (level == spdlog::level::off && str_normalized != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level);
}

}  // namespace drill_link
