#include "driver/manifest.hpp"

#include "log/log.hpp"

#include <cctype>
#include <charconv>
#include <fstream>

namespace kindred::driver {

// ============================================================================
// Validation Functions
// ============================================================================

bool is_valid_package_name(const std::string& name) {
    if (name.empty())
        return false;

    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

bool PackageInfo::validate() const {
    // The name is optional; when present it becomes the artifact name
    return name.empty() || is_valid_package_name(name);
}

bool BuildSettings::validate() const {
    if (timeout && *timeout <= 0)
        return false;
    if (source && source->empty())
        return false;
    if (output_dir && output_dir->empty())
        return false;
    if (linker && linker->empty())
        return false;
    return true;
}

// ============================================================================
// Manifest
// ============================================================================

bool Manifest::validate() const {
    return package.validate() && build.validate();
}

Result<Manifest, std::string> Manifest::parse(const std::string& content) {
    SimpleTomlParser parser(content);
    auto manifest = parser.parse();
    if (!manifest) {
        return parser.get_error();
    }
    if (!manifest->package.validate()) {
        return "invalid package name `" + manifest->package.name + "`";
    }
    if (!manifest->build.validate()) {
        return std::string("invalid [build] settings: paths must be non-empty and "
                           "timeout positive");
    }
    return *manifest;
}

Result<Manifest, std::string> Manifest::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return "cannot read " + path.string();
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto result = parse(content);
    if (is_err(result)) {
        return path.string() + ": " + unwrap_err(result);
    }
    KINDRED_LOG_DEBUG("driver", "Loaded manifest " << path.string());
    return result;
}

void Manifest::apply_to(CompileOptions& options, const fs::path& base_dir) const {
    auto resolve_path = [&base_dir](const std::string& value) {
        fs::path path(value);
        return path.is_absolute() ? path : base_dir / path;
    };

    if (!package.name.empty()) {
        options.artifact_name = package.name;
    }
    if (build.source) {
        options.source_path = resolve_path(*build.source);
    }
    if (build.output_dir) {
        options.output_directory = resolve_path(*build.output_dir);
    }
    if (build.mode) {
        options.optimization_mode = *build.mode;
    }
    if (build.linker) {
        options.linker = *build.linker;
    }
    if (build.timeout) {
        options.timeout_seconds = *build.timeout;
    }
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content)
    : content_(content), pos_(0), line_(1) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void SimpleTomlParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

// Consumes trailing blanks and a comment; true when nothing else follows on the line
bool SimpleTomlParser::at_line_end() {
    skip_inline_whitespace();
    skip_comment();
    return is_eof() || peek() == '\n';
}

std::string SimpleTomlParser::parse_identifier() {
    std::string result;
    while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                         peek() == '-')) {
        result += advance();
    }
    return result;
}

std::optional<std::string> SimpleTomlParser::parse_string() {
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case 'r':
                result += '\r';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                set_error(std::string("Invalid escape '\\") + escaped + "'");
                return std::nullopt;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return std::nullopt;
    }
    advance(); // Skip closing quote

    return result;
}

std::optional<TomlValue> SimpleTomlParser::parse_value() {
    if (peek() == '"') {
        auto text = parse_string();
        if (!text)
            return std::nullopt;
        return TomlValue{*text};
    }

    if (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '-' || peek() == '+') {
        size_t start = pos_;
        advance();
        while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
            advance();
        }
        std::string digits;
        for (size_t i = start; i < pos_; ++i) {
            if (content_[i] != '_' && content_[i] != '+')
                digits += content_[i];
        }
        int64_t number = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
        if (ec != std::errc() || end != digits.data() + digits.size()) {
            set_error("Invalid integer '" + content_.substr(start, pos_ - start) + "'");
            return std::nullopt;
        }
        return TomlValue{number};
    }

    std::string word = parse_identifier();
    if (word == "true")
        return TomlValue{true};
    if (word == "false")
        return TomlValue{false};

    set_error("Expected a string, integer or boolean value");
    return std::nullopt;
}

void SimpleTomlParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = "line " + std::to_string(line_) + ": " + message;
    }
}

bool SimpleTomlParser::assign_package(PackageInfo& info, const std::string& key,
                                      const TomlValue& value) {
    if (key != "name") {
        set_error("Unknown key '" + key + "' in [package]");
        return false;
    }
    if (!std::holds_alternative<std::string>(value)) {
        set_error("'name' must be a string");
        return false;
    }
    info.name = std::get<std::string>(value);
    return true;
}

bool SimpleTomlParser::assign_build(BuildSettings& build, const std::string& key,
                                    const TomlValue& value) {
    const auto* text = std::get_if<std::string>(&value);

    if (key == "timeout") {
        const auto* number = std::get_if<int64_t>(&value);
        if (!number || *number <= 0 || *number > 86400) {
            set_error("'timeout' must be a positive number of seconds");
            return false;
        }
        build.timeout = static_cast<int>(*number);
        return true;
    }

    if (key != "source" && key != "output_dir" && key != "mode" && key != "linker") {
        set_error("Unknown key '" + key + "' in [build]");
        return false;
    }
    if (!text) {
        set_error("'" + key + "' must be a string");
        return false;
    }

    if (key == "source") {
        build.source = *text;
    } else if (key == "output_dir") {
        build.output_dir = *text;
    } else if (key == "linker") {
        build.linker = *text;
    } else {
        auto mode = backend::parse_optimization_mode(*text);
        if (!mode) {
            set_error("'mode' must be \"Debug\" or \"Release\", found \"" + *text + "\"");
            return false;
        }
        build.mode = *mode;
    }
    return true;
}

std::optional<Manifest> SimpleTomlParser::parse() {
    Manifest manifest;
    std::string section;

    while (!is_eof()) {
        skip_whitespace();
        skip_comment();

        if (is_eof())
            break;
        if (peek() == '\n')
            continue;

        if (peek() == '[') {
            advance(); // Skip '['
            skip_inline_whitespace();
            section = parse_identifier();
            skip_inline_whitespace();

            if (peek() != ']') {
                set_error("Expected ']' after section name");
                return std::nullopt;
            }
            advance(); // Skip ']'

            if (section != "package" && section != "build") {
                set_error("Unknown section [" + section + "]");
                return std::nullopt;
            }
            if (!at_line_end()) {
                set_error("Unexpected text after section header");
                return std::nullopt;
            }
            continue;
        }

        std::string key = parse_identifier();
        if (key.empty()) {
            set_error(std::string("Unexpected character '") + peek() + "'");
            return std::nullopt;
        }
        skip_inline_whitespace();

        if (peek() != '=') {
            set_error("Expected '=' after key");
            return std::nullopt;
        }
        advance();
        skip_inline_whitespace();

        auto value = parse_value();
        if (!value)
            return std::nullopt;
        if (!at_line_end()) {
            set_error("Unexpected text after value of '" + key + "'");
            return std::nullopt;
        }

        if (section.empty()) {
            set_error("Key '" + key + "' outside of a section");
            return std::nullopt;
        }
        bool assigned = section == "package" ? assign_package(manifest.package, key, *value)
                                             : assign_build(manifest.build, key, *value);
        if (!assigned)
            return std::nullopt;
    }

    if (!error_message_.empty()) {
        return std::nullopt;
    }

    return manifest;
}

} // namespace kindred::driver
