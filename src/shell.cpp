#include "dircache/shell.hpp"

#include <cctype>
#include <sstream>
#include <utility>

namespace dircache {

// ============================================================================
// Script
// ============================================================================

void Script::push(Instruction instruction) {
    current_.push_back(std::move(instruction));
}

void Script::nest(Instruction instruction, const Block& block) {
    // Collect the block's output separately, then attach it to its parent.
    std::vector<Instruction> outer = std::move(current_);
    current_.clear();
    try {
        if (block) block();
    } catch (...) {
        current_ = std::move(outer);
        throw;
    }
    instruction.body = std::move(current_);
    current_ = std::move(outer);
    current_.push_back(std::move(instruction));
}

void Script::cmd(const std::string& text, const CmdOptions& options) {
    Instruction ins;
    ins.kind = Instruction::Kind::Cmd;
    ins.args = {text};
    ins.cmd = options;
    push(std::move(ins));
}

void Script::raw(const std::string& text) {
    Instruction ins;
    ins.kind = Instruction::Kind::Raw;
    ins.args = {text};
    push(std::move(ins));
}

void Script::if_then(const std::string& condition, const Block& block) {
    Instruction ins;
    ins.kind = Instruction::Kind::If;
    ins.args = {condition};
    nest(std::move(ins), block);
}

void Script::fold(const std::string& name, const Block& block) {
    Instruction ins;
    ins.kind = Instruction::Kind::Fold;
    ins.args = {name};
    nest(std::move(ins), block);
}

void Script::echo(const std::string& text, Ansi ansi) {
    Instruction ins;
    ins.kind = Instruction::Kind::Echo;
    ins.args = {text};
    ins.ansi = ansi;
    push(std::move(ins));
}

void Script::export_var(const std::string& name, const std::string& value) {
    Instruction ins;
    ins.kind = Instruction::Kind::Export;
    ins.args = {name, value};
    push(std::move(ins));
}

void Script::mkdir(const std::string& path, const FileOptions& options) {
    Instruction ins;
    ins.kind = Instruction::Kind::Mkdir;
    ins.args = {path};
    ins.file = options;
    push(std::move(ins));
}

void Script::chmod(const std::string& mode, const std::string& path, const FileOptions& options) {
    Instruction ins;
    ins.kind = Instruction::Kind::Chmod;
    ins.args = {mode, path};
    ins.file = options;
    push(std::move(ins));
}

static void flatten_into(const std::vector<Instruction>& instructions,
                         std::vector<const Instruction*>& out) {
    for (const auto& ins : instructions) {
        out.push_back(&ins);
        flatten_into(ins.body, out);
    }
}

std::vector<const Instruction*> Script::flatten() const {
    std::vector<const Instruction*> out;
    flatten_into(current_, out);
    return out;
}

// ============================================================================
// Rendering
// ============================================================================

std::string shell_escape(const std::string& str) {
    if (str.empty()) return "''";

    std::string result;
    result.reserve(str.size() * 2);
    for (unsigned char c : str) {
        if (c == '\n') {
            result += "'\n'";
        } else if (std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == ',' ||
                   c == ':' || c == '+' || c == '/' || c == '@') {
            result += static_cast<char>(c);
        } else {
            result += '\\';
            result += static_cast<char>(c);
        }
    }
    return result;
}

std::string bash_preamble() {
    return
        "dircache_retry() {\n"
        "  local result=0\n"
        "  local count=1\n"
        "  while [ $count -le 3 ]; do\n"
        "    [ $result -ne 0 ] && echo \"The command \\\"$*\\\" failed. Retrying, $count of 3.\" >&2\n"
        "    \"$@\" && { result=0; break; } || result=$?\n"
        "    count=$((count + 1))\n"
        "    sleep 1\n"
        "  done\n"
        "  [ $count -gt 3 ] && echo \"The command \\\"$*\\\" failed 3 times.\" >&2\n"
        "  return $result\n"
        "}\n"
        "\n"
        "dircache_time_start() {\n"
        "  dircache_start_ns=$(date +%s%N)\n"
        "}\n"
        "\n"
        "dircache_time_finish() {\n"
        "  local result=$?\n"
        "  local end_ns=$(date +%s%N)\n"
        "  echo \"dircache_time:duration=$((end_ns - dircache_start_ns))ns\"\n"
        "  return $result\n"
        "}\n"
        "\n"
        "dircache_assert() {\n"
        "  local result=$?\n"
        "  if [ $result -ne 0 ]; then\n"
        "    echo \"The command failed with exit code $result.\" >&2\n"
        "    exit 2\n"
        "  fi\n"
        "}\n"
        "\n";
}

static const char* ansi_code(Ansi ansi) {
    switch (ansi) {
        case Ansi::Red: return "\\033[31;1m";
        case Ansi::Green: return "\\033[32;1m";
        case Ansi::Yellow: return "\\033[33;1m";
        case Ansi::None: break;
    }
    return "";
}

static void render_into(const std::vector<Instruction>& instructions,
                        std::ostringstream& out, int depth) {
    const std::string indent(static_cast<size_t>(depth) * 2, ' ');

    for (const auto& ins : instructions) {
        switch (ins.kind) {
            case Instruction::Kind::Cmd: {
                const auto& text = ins.args.at(0);
                const auto& opt = ins.cmd;
                if (opt.echo) {
                    out << indent << "echo "
                        << shell_escape(opt.echo_text.empty() ? "$ " + text : opt.echo_text) << "\n";
                }
                if (opt.timing) out << indent << "dircache_time_start\n";
                out << indent << (opt.retry ? "dircache_retry " : "") << text << "\n";
                if (opt.timing) out << indent << "dircache_time_finish\n";
                if (opt.assert_ok) out << indent << "dircache_assert\n";
                break;
            }
            case Instruction::Kind::Raw:
                out << indent << ins.args.at(0) << "\n";
                break;
            case Instruction::Kind::If:
                out << indent << "if [[ " << ins.args.at(0) << " ]]; then\n";
                render_into(ins.body, out, depth + 1);
                out << indent << "fi\n";
                break;
            case Instruction::Kind::Fold:
                out << indent << "echo -en 'fold:start:" << ins.args.at(0) << "\\r'\n";
                render_into(ins.body, out, depth);
                out << indent << "echo -en 'fold:end:" << ins.args.at(0) << "\\r'\n";
                break;
            case Instruction::Kind::Echo:
                if (ins.ansi == Ansi::None) {
                    out << indent << "echo " << shell_escape(ins.args.at(0)) << "\n";
                } else {
                    out << indent << "printf '" << ansi_code(ins.ansi) << "%s\\033[0m\\n' "
                        << shell_escape(ins.args.at(0)) << "\n";
                }
                break;
            case Instruction::Kind::Export:
                out << indent << "export " << ins.args.at(0) << "=" << ins.args.at(1) << "\n";
                break;
            case Instruction::Kind::Mkdir: {
                std::string line = std::string("mkdir ") + (ins.file.recursive ? "-p " : "") + ins.args.at(0);
                if (ins.file.echo) out << indent << "echo " << shell_escape("$ " + line) << "\n";
                out << indent << line << "\n";
                if (ins.file.assert_ok) out << indent << "dircache_assert\n";
                break;
            }
            case Instruction::Kind::Chmod: {
                std::string line = "chmod " + ins.args.at(0) + " " + ins.args.at(1);
                if (ins.file.echo) out << indent << "echo " << shell_escape("$ " + line) << "\n";
                out << indent << line << "\n";
                if (ins.file.assert_ok) out << indent << "dircache_assert\n";
                break;
            }
        }
    }
}

std::string render_bash(const std::vector<Instruction>& instructions, bool with_preamble) {
    std::ostringstream out;
    if (with_preamble) out << bash_preamble();
    render_into(instructions, out, 0);
    return out.str();
}

}  // namespace dircache
