#include "kdeploy/config/ConfigParser.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <set>
#include <type_traits>

namespace kdeploy {

// ============================================================================
// Lexer Implementation
// ============================================================================

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    tokens.reserve(source_.size() / 8);

    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) break;

        char c = peek();

        // Skip comments
        if (c == '/' && peekNext() == '/') {
            skipComment();
            continue;
        }

        if (c == '/' && peekNext() == '*') {
            advance(); advance(); // Skip /*
            while (!isAtEnd() && !(peek() == '*' && peekNext() == '/')) {
                advance();
            }
            if (isAtEnd()) {
                addError("Unterminated comment");
                break;
            }
            advance(); advance(); // Skip */
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            tokens.push_back(number());
            continue;
        }

        if (c == '"') {
            tokens.push_back(string());
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            tokens.push_back(identifier());
            continue;
        }

        switch (c) {
            case '{': tokens.push_back(makeToken(TokenType::LeftBrace)); advance(); break;
            case '}': tokens.push_back(makeToken(TokenType::RightBrace)); advance(); break;
            case '[': tokens.push_back(makeToken(TokenType::LeftBracket)); advance(); break;
            case ']': tokens.push_back(makeToken(TokenType::RightBracket)); advance(); break;
            case ':': tokens.push_back(makeToken(TokenType::Colon)); advance(); break;
            case ';': tokens.push_back(makeToken(TokenType::Semicolon)); advance(); break;
            case ',': tokens.push_back(makeToken(TokenType::Comma)); advance(); break;
            case '-': tokens.push_back(makeToken(TokenType::Minus)); advance(); break;

            default:
                addError(std::string("Unexpected character: ") + c);
                advance();
                break;
        }
    }

    tokens.push_back(Token(TokenType::EndOfFile, "", line_, column_));
    return tokens;
}

char Lexer::peek() const {
    if (isAtEnd()) return '\0';
    return source_[current_];
}

char Lexer::peekNext() const {
    if (current_ + 1 >= source_.length()) return '\0';
    return source_[current_ + 1];
}

char Lexer::advance() {
    char c = source_[current_++];
    column_++;
    if (c == '\n') {
        line_++;
        column_ = 1;
    }
    return c;
}

bool Lexer::isAtEnd() const {
    return current_ >= source_.length();
}

void Lexer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

void Lexer::skipComment() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
}

Token Lexer::makeToken(TokenType type) {
    return Token(type, "", line_, column_);
}

Token Lexer::number() {
    int start_line = line_;
    int start_col = column_;
    std::string num;
    num.reserve(16);

    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        num += advance();
    }

    if (num.size() > 9) {
        addError("Integer literal out of range: " + num);
        return Token(TokenType::Invalid, num, start_line, start_col);
    }

    return Token(TokenType::Integer, num, start_line, start_col, std::stoi(num));
}

Token Lexer::string() {
    int start_line = line_;
    int start_col = column_;

    advance(); // consume opening "

    std::string str;
    str.reserve(32);
    while (!isAtEnd() && peek() != '"') {
        if (peek() == '\\') {
            advance();
            if (!isAtEnd()) {
                char c = advance();
                switch (c) {
                    case 'n': str += '\n'; break;
                    case 't': str += '\t'; break;
                    case '"': str += '"'; break;
                    case '\\': str += '\\'; break;
                    default: str += c; break;
                }
            }
        } else {
            str += advance();
        }
    }

    if (isAtEnd()) {
        addError("Unterminated string");
        return Token(TokenType::Invalid, str, start_line, start_col);
    }

    advance(); // consume closing "

    return Token(TokenType::String, str, start_line, start_col, str);
}

Token Lexer::identifier() {
    int start_line = line_;
    int start_col = column_;
    std::string text;
    text.reserve(16);

    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        text += advance();
    }

    if (text == "true") {
        return Token(TokenType::TokTrue, text, start_line, start_col, true);
    }
    if (text == "false") {
        return Token(TokenType::TokFalse, text, start_line, start_col, false);
    }

    return Token(TokenType::Identifier, text, start_line, start_col);
}

void Lexer::addError(const std::string& message) {
    std::ostringstream oss;
    oss << "Line " << line_ << ", Col " << column_ << ": " << message;
    errors_.push_back(oss.str());
}

// ============================================================================
// Parser Implementation
// ============================================================================

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

std::unique_ptr<ast::ConfigFile> Parser::parse() {
    auto config = std::make_unique<ast::ConfigFile>();

    while (!isAtEnd()) {
        size_t before = current_;
        auto blk = block();
        if (blk) {
            config->blocks.push_back(std::move(blk));
        } else {
            synchronize();
            if (current_ == before) {
                advance();
            }
        }
    }

    return config;
}

const Token& Parser::peek() const {
    return tokens_[current_];
}

const Token& Parser::previous() const {
    return tokens_[current_ - 1];
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::EndOfFile;
}

const Token& Parser::advance() {
    if (!isAtEnd()) current_++;
    return previous();
}

bool Parser::check(TokenType type) const {
    if (isAtEnd()) return false;
    return peek().type == type;
}

bool Parser::match(std::initializer_list<TokenType> types) {
    for (auto type : types) {
        if (check(type)) {
            advance();
            return true;
        }
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) return advance();

    addError(message);
    return peek();
}

std::unique_ptr<ast::Block> Parser::block() {
    if (!check(TokenType::Identifier)) {
        addError("Expected block name");
        return nullptr;
    }

    const Token& name_token = advance();

    auto blk = std::make_unique<ast::Block>();
    blk->name = name_token.lexeme;
    blk->line = name_token.line;

    if (!check(TokenType::Colon)) {
        addError("Expected ':' after block name '" + blk->name + "'");
        return nullptr;
    }
    advance();

    if (!check(TokenType::LeftBrace)) {
        addError("Expected '{' to start block '" + blk->name + "'");
        return nullptr;
    }
    advance();

    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        size_t before = current_;
        auto stmt = statement();
        if (stmt) {
            blk->statements.push_back(std::move(stmt));
        } else if (current_ == before) {
            advance();
        }
    }

    consume(TokenType::RightBrace, "Expected '}' to close block '" + blk->name + "'");

    // Optional semicolon after block
    match({TokenType::Semicolon});

    return blk;
}

std::unique_ptr<ast::Statement> Parser::statement() {
    if (check(TokenType::Identifier)) {
        // Look ahead: "name: {" opens a nested block
        size_t saved = current_;
        advance();

        if (check(TokenType::Colon)) {
            advance();
            if (check(TokenType::LeftBrace)) {
                current_ = saved;
                auto blk = block();
                if (!blk) {
                    return nullptr;
                }
                auto stmt = std::make_unique<ast::Statement>();
                stmt->value = std::move(*blk);
                return stmt;
            }
        }

        current_ = saved;
        return assignment();
    }

    if (check(TokenType::String)) {
        return assignment();
    }

    addError("Expected statement");
    synchronize();
    return nullptr;
}

std::unique_ptr<ast::Statement> Parser::assignment() {
    std::string name;
    int line = peek().line;

    // Accept both identifiers and string literals as names
    if (match({TokenType::Identifier})) {
        name = previous().lexeme;
    } else if (match({TokenType::String})) {
        if (auto* val = std::get_if<std::string>(&previous().literal_value)) {
            name = *val;
        }
    } else {
        addError("Expected identifier or string for assignment name");
        return nullptr;
    }

    if (!check(TokenType::Colon)) {
        addError("Expected ':' after '" + name + "'");
        synchronize();
        return nullptr;
    }
    advance();

    auto value = expression();
    if (!value) {
        synchronize();
        return nullptr;
    }

    // Optional semicolon
    match({TokenType::Semicolon});

    auto stmt = std::make_unique<ast::Statement>();
    stmt->value = ast::Assignment{name, line, std::move(value)};

    return stmt;
}

std::unique_ptr<ast::Expression> Parser::expression() {
    if (match({TokenType::Minus})) {
        if (!match({TokenType::Integer})) {
            addError("Expected integer after '-'");
            return nullptr;
        }
        auto expr = std::make_unique<ast::Expression>();
        expr->value = ast::IntLiteral{-std::get<int>(previous().literal_value)};
        return expr;
    }

    if (match({TokenType::Integer})) {
        auto expr = std::make_unique<ast::Expression>();
        if (auto* val = std::get_if<int>(&previous().literal_value)) {
            expr->value = ast::IntLiteral{*val};
        }
        return expr;
    }

    if (match({TokenType::String})) {
        auto expr = std::make_unique<ast::Expression>();
        if (auto* val = std::get_if<std::string>(&previous().literal_value)) {
            expr->value = ast::StringLiteral{*val};
        }
        return expr;
    }

    if (match({TokenType::TokTrue, TokenType::TokFalse})) {
        auto expr = std::make_unique<ast::Expression>();
        if (auto* val = std::get_if<bool>(&previous().literal_value)) {
            expr->value = ast::BoolLiteral{*val};
        }
        return expr;
    }

    // Array literal
    if (match({TokenType::LeftBracket})) {
        ast::ArrayLiteral array;

        while (!check(TokenType::RightBracket) && !isAtEnd()) {
            auto elem = expression();
            if (!elem) {
                return nullptr;
            }
            array.elements.push_back(std::move(elem));

            if (!match({TokenType::Comma})) {
                break;
            }
        }

        consume(TokenType::RightBracket, "Expected ']' after array elements");

        auto expr = std::make_unique<ast::Expression>();
        expr->value = std::move(array);
        return expr;
    }

    addError("Expected expression");
    return nullptr;
}

void Parser::addError(const std::string& message) {
    std::ostringstream oss;
    oss << "Line " << peek().line << ": " << message;
    errors_.push_back(oss.str());
}

void Parser::synchronize() {
    while (!isAtEnd()) {
        if (current_ > 0 && previous().type == TokenType::Semicolon) return;
        if (peek().type == TokenType::RightBrace) return;

        advance();
    }
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        reportError("Config file not found: " + path.string());
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        reportError("Failed to open config file: " + path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::cout << "[Config] Loading " << path.string() << std::endl;
    return loadFromString(buffer.str());
}

bool ConfigParser::loadFromString(const std::string& source) {
    // Tokenize
    Lexer lexer(source);
    auto tokens = lexer.tokenize();

    if (!lexer.getErrors().empty()) {
        reportErrors(lexer.getErrors());
        return false;
    }

    // Parse
    Parser parser(tokens);
    auto ast = parser.parse();

    if (!parser.getErrors().empty()) {
        reportErrors(parser.getErrors());
        return false;
    }

    // Interpret
    return interpret(*ast);
}

std::string ConfigParser::getEmbeddedConfig() {
    // Stock Pilot Kneeboard deployment. User config files are applied on top.
    return R"(
kdeploy: {
    app: {
        name: "pilot_kneeboard"
        title: "Pilot Kneeboard"
        comment: "Digital kneeboard for pilots"
        version: "1.0.0"
        entry_point: "kneeboard_gui.py"
        runtime: "/usr/bin/python3"
        service_name: "kneeboard"
    }

    // Raspberry Pi with the touchscreen on the HDMI output
    board: {
        model_file: "/proc/device-tree/model"
        os_release_file: "/etc/os-release"
        model_match: "Raspberry Pi"
        output: "HDMI-1"
        rotation: "right"
    }

    launch: {
        framebuffer_command: ["xvfb-run", "-a"]
        headless_variable: "HEADLESS"
    }

    service: {
        template: "kneeboard.service"
        unit_directory: "/etc/systemd/system"
        active_probe_ms: 1000
    }

    autostart: {
        file_name: "kneeboard.desktop"
    }

    dependencies: {
        refresh_command: "sudo apt update"
        manifest: "requirements.txt"
        manifest_install: "pip install -r requirements.txt"

        // kneeboard-install: runtime, native libraries, then the UI toolkit
        install: {
            python3: {
                check: "command -v python3 && command -v pip3"
                install: "sudo apt install -y python3 python3-pip"
            }
            sdl2: {
                name: "SDL2 libraries"
                check: "dpkg -s libsdl2-dev libsdl2-image-dev libsdl2-mixer-dev libsdl2-ttf-dev"
                install: "sudo apt install -y libsdl2-dev libsdl2-image-dev libsdl2-mixer-dev libsdl2-ttf-dev"
            }
            gstreamer: {
                name: "GStreamer libraries"
                check: "dpkg -s libgstreamer1.0-dev libgstreamer-plugins-base1.0-dev"
                install: "sudo apt install -y libgstreamer1.0-dev libgstreamer-plugins-base1.0-dev"
            }
            ffmpeg: {
                name: "FFmpeg libraries"
                check: "dpkg -s libavcodec-dev libavdevice-dev libavfilter-dev libavformat-dev libavutil-dev libswscale-dev libswresample-dev"
                install: "sudo apt install -y libavcodec-dev libavdevice-dev libavfilter-dev libavformat-dev libavutil-dev libswscale-dev libswresample-dev"
                required: false
            }
            python3_dev: {
                name: "python3-dev"
                check: "dpkg -s python3-dev"
                install: "sudo apt install -y python3-dev"
            }
            kivy: {
                name: "Kivy"
                check: "python3 -c \"import kivy\""
                install: "pip3 install kivy"
            }
        }

        // kneeboard-run: what the launcher needs before starting the app
        run: {
            python3: {
                check: "command -v python3"
                install: "sudo apt install -y python3 python3-pip"
            }
            tkinter: {
                check: "python3 -c \"import tkinter\""
                install: "sudo apt install -y --fix-broken python3-tk"
            }
            pillow: {
                name: "Pillow"
                check: "python3 -c \"from PIL import Image, ImageTk\""
                install: "sudo apt install -y --fix-broken python3-pil python3-pil.imagetk && pip3 install -r requirements.txt --break-system-packages"
            }
            xvfb: {
                name: "X virtual framebuffer"
                check: "dpkg -s xvfb x11-xserver-utils"
                install: "sudo apt install -y --fix-broken xvfb x11-xserver-utils"
                when: "headless"
            }
        }

        // Desktop test hosts install everything from the manifest in one go
        windows: {
            python: {
                check: "python --version"
                install: "pip install -r requirements.txt"
            }
            kivy: {
                name: "Kivy"
                check: "python -c \"import kivy\""
                install: "pip install -r requirements.txt"
            }
            pillow: {
                name: "Pillow"
                check: "python -c \"from PIL import Image\""
                install: "pip install -r requirements.txt"
                required: false
            }
        }
    }

    package: {
        files: [
            "kneeboard_gui.py",
            "README.md",
            "LICENSE.txt",
            "requirements.txt",
            "install.sh",
            "setup_service.sh",
            "kneeboard.service",
            "run_kneeboard.bat",
            "install_windows.bat"
        ]
    }

    cleanup: {
        directories: ["__pycache__"]
        patterns: ["*.pyc", "*.pyo", "*.pyd", "*.log", "*~", "*.bak", "*.swp", "*.swo"]
        toolkit_cache: "~/.kivy/cache"
    }
}
)";
}

bool ConfigParser::interpret(const ast::ConfigFile& ast) {
    size_t errors_before = errors_.size();

    for (const auto& blk : ast.blocks) {
        if (blk) {
            evaluateBlock(*blk);
        }
    }

    return errors_.size() == errors_before;
}

void ConfigParser::evaluateBlock(const ast::Block& block) {
    if (block.name != "kdeploy") {
        // Sections may also be written at top level
        evaluateSection(block);
        return;
    }

    for (const auto& stmt : block.statements) {
        if (auto* section = std::get_if<ast::Block>(&stmt->value)) {
            evaluateSection(*section);
        } else if (auto* assignment = std::get_if<ast::Assignment>(&stmt->value)) {
            std::cerr << "[Config] Warning: line " << assignment->line
                      << ": ignoring top-level setting '" << assignment->name << "'" << std::endl;
        }
    }
}

void ConfigParser::evaluateSection(const ast::Block& block) {
    if (block.name == "dependencies") {
        for (const auto& stmt : block.statements) {
            if (auto* set = std::get_if<ast::Block>(&stmt->value)) {
                if (set->name == "install") {
                    config_.dependencies.install = evaluateDependencies(*set);
                } else if (set->name == "run") {
                    config_.dependencies.run = evaluateDependencies(*set);
                } else if (set->name == "windows") {
                    config_.dependencies.windows = evaluateDependencies(*set);
                } else {
                    std::cerr << "[Config] Warning: line " << set->line
                              << ": unknown dependency set '" << set->name << "'" << std::endl;
                }
                continue;
            }

            const auto& assignment = std::get<ast::Assignment>(stmt->value);
            Value value = evaluateExpression(*assignment.value);
            auto& deps = config_.dependencies;

            if (assignment.name == "refresh_command") {
                assignString(assignment, value, deps.refresh_command);
            } else if (assignment.name == "manifest") {
                assignString(assignment, value, deps.manifest);
            } else if (assignment.name == "manifest_install") {
                assignString(assignment, value, deps.manifest_install);
            } else {
                std::cerr << "[Config] Warning: line " << assignment.line
                          << ": unknown setting dependencies." << assignment.name << std::endl;
            }
        }
        return;
    }

    static const std::set<std::string> sections = {
        "app", "board", "launch", "service", "autostart", "package", "cleanup"
    };
    if (sections.count(block.name) == 0) {
        std::cerr << "[Config] Warning: line " << block.line
                  << ": unknown section '" << block.name << "'" << std::endl;
        return;
    }

    for (const auto& stmt : block.statements) {
        const auto* assignment = std::get_if<ast::Assignment>(&stmt->value);
        if (!assignment) {
            const auto& nested = std::get<ast::Block>(stmt->value);
            std::cerr << "[Config] Warning: line " << nested.line
                      << ": unexpected block '" << nested.name << "' in " << block.name << std::endl;
            continue;
        }

        Value value = evaluateExpression(*assignment->value);
        const std::string& key = assignment->name;
        bool known = true;

        if (block.name == "app") {
            auto& app = config_.app;
            if (key == "name") assignString(*assignment, value, app.name);
            else if (key == "title") assignString(*assignment, value, app.title);
            else if (key == "comment") assignString(*assignment, value, app.comment);
            else if (key == "version") assignString(*assignment, value, app.version);
            else if (key == "entry_point") assignString(*assignment, value, app.entry_point);
            else if (key == "runtime") assignString(*assignment, value, app.runtime);
            else if (key == "service_name") assignString(*assignment, value, app.service_name);
            else known = false;
        } else if (block.name == "board") {
            auto& board = config_.board;
            if (key == "model_file") assignString(*assignment, value, board.model_file);
            else if (key == "os_release_file") assignString(*assignment, value, board.os_release_file);
            else if (key == "model_match") assignString(*assignment, value, board.model_match);
            else if (key == "output") assignString(*assignment, value, board.output);
            else if (key == "rotation") assignString(*assignment, value, board.rotation);
            else known = false;
        } else if (block.name == "launch") {
            auto& launch = config_.launch;
            if (key == "framebuffer_command") assignList(*assignment, value, launch.framebuffer_command);
            else if (key == "headless_variable") assignString(*assignment, value, launch.headless_variable);
            else known = false;
        } else if (block.name == "service") {
            auto& service = config_.service;
            if (key == "template") assignString(*assignment, value, service.template_file);
            else if (key == "unit_directory") assignString(*assignment, value, service.unit_directory);
            else if (key == "active_probe_ms") assignInt(*assignment, value, service.active_probe_ms);
            else known = false;
        } else if (block.name == "autostart") {
            auto& autostart = config_.autostart;
            if (key == "directory") assignString(*assignment, value, autostart.directory);
            else if (key == "file_name") assignString(*assignment, value, autostart.file_name);
            else known = false;
        } else if (block.name == "package") {
            if (key == "files") assignList(*assignment, value, config_.package.files);
            else known = false;
        } else {
            if (key == "directories") assignList(*assignment, value, config_.cleanup.directories);
            else if (key == "patterns") assignList(*assignment, value, config_.cleanup.patterns);
            else if (key == "toolkit_cache") assignString(*assignment, value, config_.cleanup.toolkit_cache);
            else known = false;
        }

        if (!known) {
            std::cerr << "[Config] Warning: line " << assignment->line
                      << ": unknown setting " << block.name << "." << key << std::endl;
        }
    }

    if (block.name == "service" && config_.service.active_probe_ms < 0) {
        reportError("service.active_probe_ms must not be negative");
    }
}

DependencySet ConfigParser::evaluateDependencies(const ast::Block& block) {
    DependencySet set;

    for (const auto& stmt : block.statements) {
        if (auto* entry = std::get_if<ast::Block>(&stmt->value)) {
            set.push_back(evaluateDependency(*entry));
        } else {
            const auto& assignment = std::get<ast::Assignment>(stmt->value);
            reportError("Line " + std::to_string(assignment.line) + ": expected a dependency block in '" +
                        block.name + "', found setting '" + assignment.name + "'");
        }
    }

    return set;
}

Dependency ConfigParser::evaluateDependency(const ast::Block& block) {
    Dependency dep;
    dep.name = block.name;

    for (const auto& stmt : block.statements) {
        const auto* assignment = std::get_if<ast::Assignment>(&stmt->value);
        if (!assignment) {
            reportError("Line " + std::to_string(block.line) + ": nested block in dependency '" + block.name + "'");
            continue;
        }

        Value value = evaluateExpression(*assignment->value);
        const std::string& key = assignment->name;

        if (key == "name") {
            assignString(*assignment, value, dep.name);
        } else if (key == "check") {
            assignString(*assignment, value, dep.check_command);
        } else if (key == "install") {
            assignString(*assignment, value, dep.install_command);
        } else if (key == "required") {
            assignBool(*assignment, value, dep.required);
        } else if (key == "when") {
            std::string when;
            if (assignString(*assignment, value, when)) {
                if (when == "always") {
                    dep.condition = DependencyCondition::Always;
                } else if (when == "headless") {
                    dep.condition = DependencyCondition::HeadlessOnly;
                } else {
                    reportError("Line " + std::to_string(assignment->line) +
                                ": 'when' must be \"always\" or \"headless\", got \"" + when + "\"");
                }
            }
        } else {
            std::cerr << "[Config] Warning: line " << assignment->line
                      << ": unknown dependency setting '" << key << "'" << std::endl;
        }
    }

    if (dep.check_command.empty()) {
        reportError("Line " + std::to_string(block.line) + ": dependency '" + block.name + "' has no check command");
    }
    if (dep.install_command.empty()) {
        reportError("Line " + std::to_string(block.line) + ": dependency '" + block.name + "' has no install command");
    }

    return dep;
}

ConfigParser::Value ConfigParser::evaluateExpression(const ast::Expression& expr) {
    return std::visit([this](auto&& value) -> Value {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, ast::IntLiteral>) {
            return value.value;
        } else if constexpr (std::is_same_v<T, ast::StringLiteral>) {
            return value.value;
        } else if constexpr (std::is_same_v<T, ast::BoolLiteral>) {
            return value.value;
        } else {
            // Arrays hold strings; scalars are converted
            std::vector<std::string> result;
            for (const auto& elem : value.elements) {
                auto elem_val = evaluateExpression(*elem);
                if (auto* s = std::get_if<std::string>(&elem_val)) {
                    result.push_back(*s);
                } else if (auto* i = std::get_if<int>(&elem_val)) {
                    result.push_back(std::to_string(*i));
                } else if (auto* b = std::get_if<bool>(&elem_val)) {
                    result.push_back(*b ? "true" : "false");
                }
            }
            return result;
        }
    }, expr.value);
}

bool ConfigParser::assignString(const ast::Assignment& assignment, const Value& value, std::string& target) {
    if (auto* s = std::get_if<std::string>(&value)) {
        target = *s;
        return true;
    }
    reportError("Line " + std::to_string(assignment.line) + ": '" + assignment.name + "' expects a string");
    return false;
}

bool ConfigParser::assignInt(const ast::Assignment& assignment, const Value& value, int& target) {
    if (auto* i = std::get_if<int>(&value)) {
        target = *i;
        return true;
    }
    reportError("Line " + std::to_string(assignment.line) + ": '" + assignment.name + "' expects an integer");
    return false;
}

bool ConfigParser::assignBool(const ast::Assignment& assignment, const Value& value, bool& target) {
    if (auto* b = std::get_if<bool>(&value)) {
        target = *b;
        return true;
    }
    reportError("Line " + std::to_string(assignment.line) + ": '" + assignment.name + "' expects true or false");
    return false;
}

bool ConfigParser::assignList(const ast::Assignment& assignment, const Value& value, std::vector<std::string>& target) {
    if (auto* list = std::get_if<std::vector<std::string>>(&value)) {
        target = *list;
        return true;
    }
    reportError("Line " + std::to_string(assignment.line) + ": '" + assignment.name + "' expects a list");
    return false;
}

void ConfigParser::reportError(const std::string& message) {
    std::cerr << "[Config] Error: " << message << std::endl;
    errors_.push_back(message);
}

void ConfigParser::reportErrors(const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        reportError(error);
    }
}

std::filesystem::path ConfigParser::getDefaultConfigPath() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config != nullptr && xdg_config[0] != '\0') {
        return std::filesystem::path(xdg_config) / "kdeploy" / "kdeploy.conf";
    }

    auto home = std::getenv("HOME");
    if (!home) return "/etc/kdeploy/kdeploy.conf";

    return std::filesystem::path(home) / ".config" / "kdeploy" / "kdeploy.conf";
}

std::optional<std::filesystem::path> ConfigParser::resolveConfigPath(
    const std::optional<std::filesystem::path>& explicit_path) {
    if (explicit_path.has_value()) {
        return explicit_path;
    }

    std::error_code ec;
    std::filesystem::path local = "kdeploy.conf";
    if (std::filesystem::exists(local, ec)) {
        return local;
    }

    auto user_config = getDefaultConfigPath();
    if (std::filesystem::exists(user_config, ec)) {
        return user_config;
    }

    return std::nullopt;
}

} // namespace kdeploy
