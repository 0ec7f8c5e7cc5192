#pragma once

#include "package.hpp"
#include "process.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dastore {

// A transaction argv, or the reason none could be built.
struct TransactionCommand {
    Argv argv;
    std::string error;  // Empty if no error

    bool has_error() const { return !error.empty(); }
};

// Abstract base class for the tool that searches and changes packages
class Backend {
public:
    explicit Backend(std::string privilege_helper = "pkexec")
        : privilege_helper_(std::move(privilege_helper)) {}
    virtual ~Backend() = default;

    // "pacman" or "yay"
    virtual std::string name() const = 0;

    virtual Argv search_command(const std::string &query) const = 0;
    virtual Argv info_command(const std::string &package) const = 0;

    // Build the argv that performs `op` on `targets`.
    virtual TransactionCommand transaction(OperationType op,
                                           const std::vector<std::string> &targets) const = 0;

    // Local database queries always go to pacman.
    Argv installed_command(const std::vector<std::string> &names) const;
    Argv updates_command() const { return {"pacman", "-Qu"}; }
    Argv orphans_command() const { return {"pacman", "-Qdtq"}; }

    const std::string &privilege_helper() const { return privilege_helper_; }

protected:
    std::string privilege_helper_;
};

class PacmanBackend : public Backend {
public:
    using Backend::Backend;

    std::string name() const override { return "pacman"; }
    Argv search_command(const std::string &query) const override;
    Argv info_command(const std::string &package) const override;
    TransactionCommand transaction(OperationType op,
                                   const std::vector<std::string> &targets) const override;
};

// yay runs as the user and elevates through --sudo.
class YayBackend : public Backend {
public:
    using Backend::Backend;

    std::string name() const override { return "yay"; }
    Argv search_command(const std::string &query) const override;
    Argv info_command(const std::string &package) const override;
    TransactionCommand transaction(OperationType op,
                                   const std::vector<std::string> &targets) const override;
};

using BackendPtr = std::unique_ptr<Backend>;

// nullptr for an unknown name
BackendPtr create_backend(const std::string &name, const std::string &privilege_helper);

} // namespace dastore
