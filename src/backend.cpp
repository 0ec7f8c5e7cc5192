#include "backend.hpp"

namespace dastore {

const char *operation_name(OperationType op) {
    switch (op) {
        case OperationType::Install:      return "install";
        case OperationType::Uninstall:    return "uninstall";
        case OperationType::Update:       return "update";
        case OperationType::SystemUpdate: return "system_update";
        case OperationType::QueueInstall: return "queue_install";
        case OperationType::CleanOrphans: return "clean_orphans";
    }
    return "unknown";
}

namespace {

bool needs_targets(OperationType op) {
    return op != OperationType::SystemUpdate;
}

void append(Argv &argv, const std::vector<std::string> &more) {
    argv.insert(argv.end(), more.begin(), more.end());
}

TransactionCommand missing_targets(OperationType op) {
    TransactionCommand cmd;
    if (op == OperationType::CleanOrphans) {
        cmd.error = "No orphaned packages to remove.";
    } else {
        cmd.error = std::string("No package given for ") + operation_name(op) + ".";
    }
    return cmd;
}

} // anonymous namespace

Argv Backend::installed_command(const std::vector<std::string> &names) const {
    Argv argv = {"pacman", "-Qq"};
    append(argv, names);
    return argv;
}

// ───────────────────────────────────────────────
//  pacman
// ───────────────────────────────────────────────

Argv PacmanBackend::search_command(const std::string &query) const {
    return {"pacman", "-Ss", query};
}

Argv PacmanBackend::info_command(const std::string &package) const {
    return {"pacman", "-Si", package};
}

TransactionCommand PacmanBackend::transaction(OperationType op,
                                              const std::vector<std::string> &targets) const {
    if (needs_targets(op) && targets.empty()) {
        return missing_targets(op);
    }

    TransactionCommand cmd;
    if (!privilege_helper_.empty()) {
        cmd.argv.push_back(privilege_helper_);
    }
    cmd.argv.push_back("pacman");

    switch (op) {
        case OperationType::Install:
        case OperationType::Update:
            cmd.argv.push_back("-S");
            cmd.argv.push_back("--noconfirm");
            cmd.argv.push_back(targets.front());
            break;
        case OperationType::Uninstall:
            cmd.argv.push_back("-R");
            cmd.argv.push_back("--noconfirm");
            cmd.argv.push_back(targets.front());
            break;
        case OperationType::SystemUpdate:
            cmd.argv.push_back("-Syu");
            cmd.argv.push_back("--noconfirm");
            break;
        case OperationType::QueueInstall:
            cmd.argv.push_back("-S");
            cmd.argv.push_back("--noconfirm");
            append(cmd.argv, targets);
            break;
        case OperationType::CleanOrphans:
            cmd.argv.push_back("-Rns");
            cmd.argv.push_back("--noconfirm");
            append(cmd.argv, targets);
            break;
    }

    return cmd;
}

// ───────────────────────────────────────────────
//  yay
// ───────────────────────────────────────────────

Argv YayBackend::search_command(const std::string &query) const {
    // --topdown lists repo packages before AUR ones
    return {"yay", "--topdown", "-Ss", query};
}

Argv YayBackend::info_command(const std::string &package) const {
    return {"yay", "-Si", package};
}

TransactionCommand YayBackend::transaction(OperationType op,
                                           const std::vector<std::string> &targets) const {
    // yay -Yc finds the orphans itself
    if (needs_targets(op) && op != OperationType::CleanOrphans && targets.empty()) {
        return missing_targets(op);
    }

    TransactionCommand cmd;
    cmd.argv.push_back("yay");
    if (!privilege_helper_.empty()) {
        cmd.argv.push_back("--sudo");
        cmd.argv.push_back(privilege_helper_);
    }

    switch (op) {
        case OperationType::Install:
        case OperationType::QueueInstall:
            cmd.argv.insert(cmd.argv.end(), {
                "-S", "--noconfirm",
                "--answerclean", "None",
                "--answerdiff", "None",
                "--answeredit", "None",
            });
            if (op == OperationType::Install) {
                cmd.argv.push_back(targets.front());
            } else {
                append(cmd.argv, targets);
            }
            break;
        case OperationType::Update:
            cmd.argv.push_back("-S");
            cmd.argv.push_back("--noconfirm");
            cmd.argv.push_back(targets.front());
            break;
        case OperationType::Uninstall:
            // Remove package and unused dependencies.
            cmd.argv.push_back("-Rns");
            cmd.argv.push_back("--noconfirm");
            cmd.argv.push_back(targets.front());
            break;
        case OperationType::SystemUpdate:
            cmd.argv.push_back("-Syu");
            cmd.argv.push_back("--noconfirm");
            break;
        case OperationType::CleanOrphans:
            cmd.argv.push_back("-Yc");
            cmd.argv.push_back("--noconfirm");
            break;
    }

    return cmd;
}

BackendPtr create_backend(const std::string &name, const std::string &privilege_helper) {
    if (name == "pacman") {
        return std::make_unique<PacmanBackend>(privilege_helper);
    } else if (name == "yay") {
        return std::make_unique<YayBackend>(privilege_helper);
    }
    return nullptr;
}

} // namespace dastore
