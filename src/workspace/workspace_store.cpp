/**
 * @file workspace_store.cpp
 * @brief WorkspaceStore implementation.
 */

#include "workspace/workspace_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <system_error>

#include <stdlib.h>

namespace sandbox_exec {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSessionPrefix = "session_";

std::string random_hex_id() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    static constexpr char kHex[] = "0123456789abcdef";

    std::string id;
    for (int word = 0; word < 2; ++word) {
        uint64_t v = dist(rng);
        for (int i = 0; i < 16; ++i) {
            id += kHex[v & 0xF];
            v >>= 4;
        }
    }
    return id;
}

/// True when `path` is `base` or lies below it. Both must be canonical.
bool is_within(const fs::path& base, const fs::path& path) {
    auto rel = path.lexically_relative(base);
    if (rel.empty()) return false;
    auto first = *rel.begin();
    return first != "..";
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<fs::path> validate_relative_path(std::string_view path) {
    if (path.empty()) {
        return invalid_request("File path must not be empty");
    }
    if (path.find('\0') != std::string_view::npos) {
        return invalid_request("File path contains a NUL byte");
    }

    fs::path p{std::string(path)};
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
        return invalid_request("File path must be relative: " + std::string(path));
    }

    auto normal = p.lexically_normal();
    if (normal.empty() || normal == "." || !normal.has_filename()) {
        return invalid_request("File path does not name a file: " + std::string(path));
    }
    for (const auto& part : normal) {
        if (part == "..") {
            return invalid_request("File path escapes the workspace: " + std::string(path));
        }
    }
    return normal;
}

Result<void> validate_session_id(std::string_view id) {
    if (id.empty() || id == "." || id == "..") {
        return invalid_request("Invalid session id: '" + std::string(id) + "'");
    }
    bool ok = std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
            || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    });
    if (!ok) {
        return invalid_request("Session id may only contain [A-Za-z0-9_.-]: " + std::string(id));
    }
    return {};
}

// ─────────────────────────────────────────────
// WorkspaceStore
// ─────────────────────────────────────────────

WorkspaceStore::WorkspaceStore(WorkspaceConfig config, Logger& logger)
    : config_(std::move(config)), logger_(logger) {}

Result<void> WorkspaceStore::validate_files(const std::vector<FileSpec>& files) const {
    for (const auto& file : files) {
        auto normal = validate_relative_path(file.path);
        if (!normal) return normal.error();

        if (normal->generic_string() == config_.entry_name) {
            return invalid_request("File path collides with the entry program: " + file.path);
        }
        if (normal->generic_string() == config_.deps_dir) {
            return invalid_request("File path collides with the dependency directory: " + file.path);
        }
    }
    return {};
}

fs::path WorkspaceStore::session_path(std::string_view session_id) const {
    return config_.effective_session_root() / (std::string(kSessionPrefix) + std::string(session_id));
}

Result<fs::path> WorkspaceStore::make_temp_dir() const {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        return Error{ErrorKind::Io, "No temporary directory: " + ec.message()};
    }

    std::string tmpl = (tmp / (config_.temp_prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        return Error{ErrorKind::Io, "mkdtemp failed: " + std::string(std::strerror(errno))};
    }
    return fs::path{buf.data()};
}

Result<Workspace> WorkspaceStore::resolve(bool persist,
                                          const std::optional<std::string>& session_id,
                                          const std::vector<FileSpec>& files) {
    if (auto valid = validate_files(files); !valid) {
        return valid.error();
    }

    Workspace workspace;
    workspace.persisted = persist;

    if (persist) {
        workspace.session_id = session_id.value_or(random_hex_id());
        if (auto valid = validate_session_id(workspace.session_id); !valid) {
            return valid.error();
        }
        workspace.root = session_path(workspace.session_id);

        std::error_code ec;
        fs::create_directories(workspace.root, ec);
        if (ec) {
            return Error{ErrorKind::Io, "Cannot create session directory "
                         + workspace.root.string() + ": " + ec.message()};
        }
        logger_.debug("Using session workspace " + workspace.root.string());
    } else {
        auto dir = make_temp_dir();
        if (!dir) return dir.error();
        workspace.root = *dir;
        workspace.session_id = random_hex_id();
        logger_.debug("Created ephemeral workspace " + workspace.root.string());
    }

    auto written = write_files(workspace, files);
    if (written) {
        std::error_code ec;
        workspace.deps = workspace.root / config_.deps_dir;
        fs::create_directories(workspace.deps, ec);
        if (ec) {
            written = Error{ErrorKind::Io, "Cannot create dependency directory: " + ec.message()};
        }
    }

    if (!written) {
        if (!persist) {
            std::error_code ec;
            fs::remove_all(workspace.root, ec);
        }
        return written.error();
    }
    return workspace;
}

Result<void> WorkspaceStore::write_files(Workspace& workspace,
                                         const std::vector<FileSpec>& files) const {
    std::error_code ec;
    auto canonical_root = fs::canonical(workspace.root, ec);
    if (ec) {
        return Error{ErrorKind::Io, "Cannot resolve workspace root: " + ec.message()};
    }

    for (const auto& file : files) {
        auto normal = validate_relative_path(file.path);
        if (!normal) return normal.error();

        // Lexical checks cannot see symlinks left behind by earlier calls
        // in the same session. Resolve before creating anything.
        auto resolved = fs::weakly_canonical(canonical_root / *normal, ec);
        if (ec || !is_within(canonical_root, resolved) || resolved == canonical_root) {
            return invalid_request("File path escapes the workspace: " + file.path);
        }

        fs::create_directories(resolved.parent_path(), ec);
        if (ec) {
            return Error{ErrorKind::Io, "Cannot create directory for " + file.path
                         + ": " + ec.message()};
        }

        std::ofstream out(resolved, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::Io, "Cannot open " + file.path + " for writing"};
        }
        out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
        if (!out) {
            return Error{ErrorKind::Io, "Failed writing " + file.path};
        }

        workspace.files_written.push_back(normal->generic_string());
    }
    return {};
}

Result<void> WorkspaceStore::remove_session(std::string_view session_id) {
    if (auto valid = validate_session_id(session_id); !valid) {
        return valid.error();
    }

    auto path = session_path(session_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error{ErrorKind::Io, "No such session: " + std::string(session_id)};
    }
    fs::remove_all(path, ec);
    if (ec) {
        return Error{ErrorKind::Io, "Cannot remove session " + std::string(session_id)
                     + ": " + ec.message()};
    }
    logger_.info("Removed session " + std::string(session_id));
    return {};
}

std::vector<std::string> WorkspaceStore::list_sessions() const {
    std::vector<std::string> ids;
    std::error_code ec;
    auto root = config_.effective_session_root();
    if (!fs::is_directory(root, ec)) return ids;

    fs::directory_iterator it(root, ec);
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) continue;
        auto name = it->path().filename().string();
        if (name.starts_with(kSessionPrefix) && name.size() > kSessionPrefix.size()) {
            ids.push_back(name.substr(kSessionPrefix.size()));
        }
    }
    if (ec) {
        logger_.warn("Listing sessions under " + root.string() + " stopped early: " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace sandbox_exec
