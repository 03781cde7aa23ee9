#pragma once
#include <memory>
#include <string>
#include <vector>

#include "audit_log.h"
#include "authenticator.h"
#include "challenge.h"
#include "config.h"
#include "gate.h"
#include "rules.h"
#include "secret_store.h"

#include "platform/platform_prompter.h"

namespace veto {

    // args exclude the program name and the subcommand itself.
    int run_auth_command(const std::vector<std::string>& args, const VetoPaths& paths);
    int run_log_command(const std::vector<std::string>& args, const VetoPaths& paths);
    int run_shell_command(const std::vector<std::string>& args, const VetoPaths& paths);

    // Loads config.toml; on failure prints the reason and returns false.
    bool load_config_or_report(const VetoPaths& paths, VetoConfig& cfg);

    /*
    Everything a gating command needs. Secrets, challenges and the authenticator
    are only opened when a command actually needs authentication, so ALLOW
    verdicts never touch the keyring. One runtime may serve many evaluations
    (veto shell); the authenticator is opened at most once.
    */
    struct GateRuntime {
        VetoPaths paths;
        VetoConfig cfg;
        std::string config_error;

        std::unique_ptr<RulesEngine> engine;
        std::unique_ptr<SecretStore> secrets;
        std::unique_ptr<ChallengeManager> challenges;
        std::unique_ptr<platform::PlatformPrompter> prompter;
        std::unique_ptr<Authenticator> auth;
        std::unique_ptr<AuditLog> audit;
        std::unique_ptr<Gate> gate;

        void load(const VetoPaths& p);
        void open_auth();
        GateResult evaluate(const GateRequest& req);
    };

} // namespace veto
