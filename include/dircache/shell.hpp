#pragma once

#include <functional>
#include <string>
#include <vector>

namespace dircache {

/// Options for Shell::cmd().
struct CmdOptions {
    bool retry = false;      // Let the executor retry the command
    bool echo = true;        // Announce the command before running it
    std::string echo_text;   // Announcement replacing "$ <command>" when set
    bool assert_ok = false;  // Abort the job on non-zero exit
    bool timing = false;     // Report the command's wall time
};

/// Options for Shell::mkdir() and Shell::chmod().
struct FileOptions {
    bool recursive = false;
    bool echo = true;
    bool assert_ok = false;
};

enum class Ansi {
    None,
    Red,
    Green,
    Yellow
};

/// One planned shell operation. If/Fold carry their nested block in `body`.
struct Instruction {
    enum class Kind {
        Cmd,
        Raw,
        If,
        Fold,
        Echo,
        Export,
        Mkdir,
        Chmod
    };

    Kind kind = Kind::Raw;
    // Cmd/Raw/Echo: {text}; If: {condition}; Fold: {name};
    // Export: {name, value}; Mkdir: {path}; Chmod: {mode, path}
    std::vector<std::string> args;
    CmdOptions cmd;
    FileOptions file;
    Ansi ansi = Ansi::None;
    std::vector<Instruction> body;
};

/// Shell emission capability consumed by the cache planner.
/// Implementations decide what "emitting" means (recording, rendering,
/// executing); callers only describe intent and order.
class Shell {
public:
    using Block = std::function<void()>;

    virtual ~Shell() = default;

    virtual void cmd(const std::string& text, const CmdOptions& options = {}) = 0;
    virtual void raw(const std::string& text) = 0;
    virtual void if_then(const std::string& condition, const Block& block) = 0;
    virtual void fold(const std::string& name, const Block& block) = 0;
    virtual void echo(const std::string& text, Ansi ansi = Ansi::None) = 0;
    virtual void export_var(const std::string& name, const std::string& value) = 0;
    virtual void mkdir(const std::string& path, const FileOptions& options = {}) = 0;
    virtual void chmod(const std::string& mode, const std::string& path,
                       const FileOptions& options = {}) = 0;
};

/// Shell that records instructions as values, in emission order.
class Script : public Shell {
public:
    void cmd(const std::string& text, const CmdOptions& options = {}) override;
    void raw(const std::string& text) override;
    void if_then(const std::string& condition, const Block& block) override;
    void fold(const std::string& name, const Block& block) override;
    void echo(const std::string& text, Ansi ansi = Ansi::None) override;
    void export_var(const std::string& name, const std::string& value) override;
    void mkdir(const std::string& path, const FileOptions& options = {}) override;
    void chmod(const std::string& mode, const std::string& path,
               const FileOptions& options = {}) override;

    const std::vector<Instruction>& instructions() const { return current_; }

    /// Depth-first (pre-order) view of every recorded instruction.
    std::vector<const Instruction*> flatten() const;

private:
    std::vector<Instruction> current_;

    void push(Instruction instruction);
    void nest(Instruction instruction, const Block& block);
};

/// Escape a word for safe embedding in a POSIX shell command line.
/// Empty input yields "''".
std::string shell_escape(const std::string& str);

/// Helper functions the rendered script relies on (retry, timing, assert).
std::string bash_preamble();

/// Render instructions as a bash script fragment.
std::string render_bash(const std::vector<Instruction>& instructions, bool with_preamble = false);

}  // namespace dircache
