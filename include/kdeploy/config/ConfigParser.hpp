#pragma once

/**
 * @file ConfigParser.hpp
 * @brief Block-syntax configuration for the deployment tools
 *
 * Lexer, parser and interpreter for kdeploy.conf. The built-in defaults
 * describe the stock Pilot Kneeboard deployment; a user file is read on
 * top of them and only overrides the keys it names.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kdeploy/provision/DependencySet.hpp"

namespace kdeploy {

/**
 * @brief AST Node types for kdeploy.conf files
 */
namespace ast {

struct IntLiteral { int value; };
struct StringLiteral { std::string value; };
struct BoolLiteral { bool value; };

struct ArrayLiteral {
    std::vector<std::unique_ptr<struct Expression>> elements;
};

using ExpressionValue = std::variant<
    IntLiteral,
    StringLiteral,
    BoolLiteral,
    ArrayLiteral
>;

struct Expression {
    ExpressionValue value;
};

struct Assignment {
    std::string name;
    int line{0};
    std::unique_ptr<Expression> value;
};

struct Block {
    std::string name;
    int line{0};
    std::vector<std::unique_ptr<struct Statement>> statements;
};

using StatementValue = std::variant<
    Assignment,
    Block
>;

struct Statement {
    StatementValue value;
};

struct ConfigFile {
    std::vector<std::unique_ptr<Block>> blocks;
};

}

enum class TokenType {
    Integer, String, TokTrue, TokFalse,

    Identifier,

    Minus, Colon, Semicolon, Comma,

    LeftBrace, RightBrace,
    LeftBracket, RightBracket,

    EndOfFile, Invalid
};

struct Token {
    TokenType type;
    std::string lexeme;
    int line;
    int column;

    std::variant<std::monostate, int, std::string, bool> literal_value;

    Token() : type(TokenType::Invalid), lexeme(""), line(0), column(0), literal_value(std::monostate{}) {}

    Token(TokenType t, std::string lex, int l, int c)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(std::monostate{}) {}

    Token(TokenType t, std::string lex, int l, int c, const std::string& lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(lit) {}

    Token(TokenType t, std::string lex, int l, int c, int lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(lit) {}

    Token(TokenType t, std::string lex, int l, int c, bool lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(lit) {}
};

class Lexer {
public:
    explicit Lexer(std::string source);

    std::vector<Token> tokenize();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::string source_;
    size_t current_{0};
    int line_{1};
    int column_{1};
    std::vector<std::string> errors_;

    inline char peek() const;
    inline char peekNext() const;
    inline char advance();
    inline bool isAtEnd() const;
    inline void skipWhitespace();
    inline void skipComment();

    Token makeToken(TokenType type);
    Token number();
    Token string();
    Token identifier();

    void addError(const std::string& message);
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    std::unique_ptr<ast::ConfigFile> parse();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::vector<Token> tokens_;
    size_t current_{0};
    std::vector<std::string> errors_;

    inline const Token& peek() const;
    inline const Token& previous() const;
    inline bool isAtEnd() const;
    inline const Token& advance();
    inline bool check(TokenType type) const;
    inline bool match(std::initializer_list<TokenType> types);
    const Token& consume(TokenType type, const std::string& message);

    std::unique_ptr<ast::Block> block();
    std::unique_ptr<ast::Statement> statement();
    std::unique_ptr<ast::Statement> assignment();
    std::unique_ptr<ast::Expression> expression();

    void addError(const std::string& message);
    void synchronize();
};

/**
 * @brief Typed deployment settings for the kiosk app
 */
class DeployConfig {
public:
    struct AppConfig {
        std::string name{"pilot_kneeboard"};
        std::string title{"Pilot Kneeboard"};
        std::string comment{"Digital kneeboard for pilots"};
        std::string version{"1.0.0"};
        std::string entry_point{"kneeboard_gui.py"};
        std::string runtime{"/usr/bin/python3"};
        std::string service_name{"kneeboard"};
    };

    struct BoardConfig {
        std::string model_file{"/proc/device-tree/model"};
        std::string os_release_file{"/etc/os-release"};
        std::string model_match{"Raspberry Pi"};
        std::string output{"HDMI-1"};
        std::string rotation{"right"};
    };

    struct LaunchConfig {
        std::vector<std::string> framebuffer_command{"xvfb-run", "-a"};
        std::string headless_variable{"HEADLESS"};
    };

    struct ServiceConfig {
        std::string template_file{"kneeboard.service"};
        std::string unit_directory{"/etc/systemd/system"};
        int active_probe_ms{1000};
    };

    struct AutostartConfig {
        std::string directory;      // empty: XDG autostart directory
        std::string file_name{"kneeboard.desktop"};
    };

    struct DependenciesConfig {
        std::string refresh_command{"sudo apt update"};
        DependencySet install;      // kneeboard-install
        DependencySet run;          // kneeboard-run
        DependencySet windows;
        std::string manifest{"requirements.txt"};
        std::string manifest_install{"pip install -r requirements.txt"};
    };

    struct PackageConfig {
        std::vector<std::string> files;
    };

    struct CleanupConfig {
        std::vector<std::string> directories;
        std::vector<std::string> patterns;
        std::string toolkit_cache;
    };

    AppConfig app;
    BoardConfig board;
    LaunchConfig launch;
    ServiceConfig service;
    AutostartConfig autostart;
    DependenciesConfig dependencies;
    PackageConfig package;
    CleanupConfig cleanup;
};

class ConfigParser {
public:
    ConfigParser() = default;

    bool load(const std::filesystem::path& path);

    bool loadFromString(const std::string& source);

    static std::string getEmbeddedConfig();

    const DeployConfig& getConfig() const { return config_; }

    const std::vector<std::string>& getErrors() const { return errors_; }

    static std::filesystem::path getDefaultConfigPath();

    // Explicit path, then ./kdeploy.conf, then the per-user config file.
    static std::optional<std::filesystem::path> resolveConfigPath(
        const std::optional<std::filesystem::path>& explicit_path);

private:
    using Value = std::variant<int, std::string, bool, std::vector<std::string>>;

    DeployConfig config_;
    std::vector<std::string> errors_;

    bool interpret(const ast::ConfigFile& ast);
    void evaluateBlock(const ast::Block& block);
    void evaluateSection(const ast::Block& block);
    DependencySet evaluateDependencies(const ast::Block& block);
    Dependency evaluateDependency(const ast::Block& block);
    Value evaluateExpression(const ast::Expression& expr);

    bool assignString(const ast::Assignment& assignment, const Value& value, std::string& target);
    bool assignInt(const ast::Assignment& assignment, const Value& value, int& target);
    bool assignBool(const ast::Assignment& assignment, const Value& value, bool& target);
    bool assignList(const ast::Assignment& assignment, const Value& value, std::vector<std::string>& target);

    void reportError(const std::string& message);
    void reportErrors(const std::vector<std::string>& errors);
};

}
