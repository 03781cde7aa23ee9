#include "rules.h"

namespace veto {

/*
Built-in rules
==============

Notes on tier placement:
- Plain recursive deletes ("rm -rf build") are MEDIUM; only targets that are
  almost never intended (root, home, dot-dirs, parent dirs, sudo) go higher.
- The whitelist deliberately has no "cat *" / "grep *" style entries: the
  whitelist is checked first, so such entries would disable the credential
  and secrets rules below.
*/
RuleSet default_rules() {
    RuleSet rs;

    rs.critical = {
        Rule{"destructive",
             {"rm -rf /", "rm -rf /*", "rm -rf ~", "rm -rf ~/*",
              "rm -fr /", "rm -fr /*", "rm -fr ~", "rm -fr ~/*",
              "mkfs*", "dd if=* of=/dev/*", "> /dev/sda*",
              ":(){ :|:& };:"},
             {},
             "Potentially destructive system command",
             false},
        Rule{"credentials",
             {"*AWS_SECRET*", "*PRIVATE_KEY*", "cat ~/.ssh/id_*", "cat *id_rsa*", "cat *id_ed25519*"},
             {"*/.ssh/id_*", "*/.aws/credentials"},
             "Credential exposure risk",
             false},
    };

    rs.high = {
        Rule{"rm-recursive-force",
             {"sudo rm -rf *", "sudo rm -fr *", "rm -rf ../*", "rm -rf .git", "rm -rf .git/*"},
             {},
             "Recursive force delete",
             false},
        Rule{"secrets",
             {"cat *.env*", "cat .env", "cat *secret*", "cat *password*"},
             {"*.env", "*.env.*", "*.pem", "*.key"},
             "Secrets file access",
             false},
        Rule{"git-destructive",
             {"git push*--force*", "git push*-f*", "git reset --hard*", "git clean -fd*"},
             {},
             "Destructive git operation",
             false},
    };

    rs.medium = {
        Rule{"rm-recursive",
             {"rm -rf *", "rm -fr *", "rm * -rf", "rm * -fr",
              "rm -r *", "rm * -r", "rm -R *", "rm * -R"},
             {},
             "Recursive delete",
             false},
        Rule{"git",
             {"git push*", "git merge*", "git rebase*"},
             {},
             "Git operation that modifies remote",
             false},
        Rule{"install",
             {"npm install*", "pip install*", "cargo install*", "brew install*",
              "apt install*", "apt-get install*"},
             {},
             "Package installation",
             false},
    };

    rs.low = {
        Rule{"rm", {"rm *"}, {}, "File deletion", false},
        Rule{"network", {"curl*", "wget*"}, {}, "Network request", false},
    };

    rs.whitelist.commands = {
        "ls*", "pwd", "echo *", "which *", "whoami", "date",
        "cargo build*", "cargo test*", "cargo check*", "cargo fmt*", "cargo clippy*",
        "npm run*", "npm test*",
        "git status*", "git log*", "git diff*", "git branch*", "git show*",
    };

    return rs;
}

} // namespace veto
