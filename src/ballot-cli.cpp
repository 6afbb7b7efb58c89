// BALLOT CLI - Command Line Interface
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// The ballot-cli tool drives a ballot stored in a local data directory.
// Each invocation runs one command as the identity given by --caller, or a
// whole script of "<caller> <command> [params]" lines with --stdin.

#include <ballot/db/database.h>
#include <ballot/util/config.h>
#include <ballot/util/logging.h>
#include <ballot/voting/ballot.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ballot {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "BALLOT CLI";

/// Subdirectory of the data directory holding the key-value store
constexpr const char* STORE_DIRNAME = "ballotdb";

// ============================================================================
// Exit Codes
// ============================================================================

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;      // Bad arguments, configuration or storage failure
constexpr int EXIT_REJECTED = 2;   // The ballot refused the operation

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    util::ConfigManager settings;

    std::string dataDir;
    std::string storage;
    bool truncateNames{false};
    std::string caller;

    bool stdinMode{false};
    bool showHelp{false};
    bool showVersion{false};

    std::string command;
    std::vector<std::string> args;
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: ballot-cli [options] <command> [params]\n";
    std::cout << "       ballot-cli [options] --stdin < script\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path (default: <datadir>/ballot.conf)\n";
    std::cout << "  -d, --datadir=DIR          Data directory path (default: ~/.ballot)\n";
    std::cout << "  -u, --caller=ID            Identity issuing the command\n";
    std::cout << "  --storage=leveldb|memory   Storage backend\n";
    std::cout << "  --truncatenames            Cut proposal names to 32 bytes instead of failing\n";
    std::cout << "  --stdin                    Read '<caller> <command> [params]' lines from stdin\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error, off (default: warn)\n";
    std::cout << "  --debug=CATEGORIES         Comma-separated categories, or 'all'\n";
    std::cout << "  --logfile=FILE             Also write log output to FILE\n";
    std::cout << "  --noprinttoconsole         Do not log to stderr\n";
    std::cout << "\nIdentities are 40 hex digits or a label of at most 20 bytes.\n";
    std::cout << "Use 'ballot-cli help' for a list of commands.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  ballot-cli --caller=chair create alpha beta gamma\n";
    std::cout << "  ballot-cli --caller=chair giverights alice\n";
    std::cout << "  ballot-cli --caller=alice vote 1\n";
    std::cout << "  ballot-cli winnername\n";
    std::cout << "\n";
}

void PrintCommands() {
    std::cout << "== Administration ==\n";
    std::cout << "create <name>...          Start a ballot, the caller becomes administrator\n";
    std::cout << "giverights <voter>        Grant a voter weight 1\n";
    std::cout << "weight <voter>            Show a voter's weight\n";
    std::cout << "voterinfo <voter>         Show a voter's record and delegation chain\n";
    std::cout << "voters                    List all voter records\n";
    std::cout << "\n== Voting ==\n";
    std::cout << "vote <index>              Vote for a proposal\n";
    std::cout << "delegate <to>             Delegate your weight\n";
    std::cout << "hasvoted                  Whether you have voted or delegated\n";
    std::cout << "\n== Results ==\n";
    std::cout << "winner                    Index of the leading proposal\n";
    std::cout << "winnername                Name of the leading proposal\n";
    std::cout << "proposals                 List proposals with vote counts\n";
    std::cout << "proposal <index>          Show one proposal\n";
    std::cout << "audit                     Check that all granted weight is accounted for\n";
    std::cout << "\n== Utility ==\n";
    std::cout << "help                      Show this list\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 BALLOT Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"caller", required_argument, nullptr, 'u'},
        {"storage", required_argument, nullptr, 1001},
        {"truncatenames", no_argument, nullptr, 1002},
        {"stdin", no_argument, nullptr, 1003},
        {"loglevel", required_argument, nullptr, 1004},
        {"debug", required_argument, nullptr, 1005},
        {"logfile", required_argument, nullptr, 1006},
        {"printtoconsole", no_argument, nullptr, 1007},
        {"noprinttoconsole", no_argument, nullptr, 1008},
        {nullptr, 0, nullptr, 0}
    };

    util::ConfigManager& settings = config.settings;
    int opt;
    int optionIndex = 0;

    optind = 1;

    // '+' stops at the first non-option so command params may start with '-'
    while ((opt = getopt_long(argc, argv, "+hvc:d:u:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                settings.SetCommandLine(util::ConfigKeys::CONF, optarg);
                break;
            case 'd':
                settings.SetCommandLine(util::ConfigKeys::DATADIR, optarg);
                break;
            case 'u':
                settings.SetCommandLine(util::ConfigKeys::CALLER, optarg);
                break;
            case 1001:
                settings.SetCommandLine(util::ConfigKeys::STORAGE, optarg);
                break;
            case 1002:
                settings.SetCommandLine(util::ConfigKeys::TRUNCATENAMES, "1");
                break;
            case 1003:
                config.stdinMode = true;
                break;
            case 1004:
                settings.SetCommandLine(util::ConfigKeys::LOGLEVEL, optarg);
                break;
            case 1005:
                settings.SetCommandLine(util::ConfigKeys::DEBUG, optarg);
                break;
            case 1006:
                settings.SetCommandLine(util::ConfigKeys::LOGFILE, optarg);
                break;
            case 1007:
                settings.SetCommandLine(util::ConfigKeys::PRINTTOCONSOLE, "1");
                break;
            case 1008:
                settings.SetCommandLine(util::ConfigKeys::PRINTTOCONSOLE, "0");
                break;
            case '?':
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        if (config.command.empty()) {
            config.command = argv[i];
        } else {
            config.args.push_back(argv[i]);
        }
    }

    return true;
}

// ============================================================================
// Configuration Loading
// ============================================================================

/// Merge the config file under the command line and resolve settings
bool LoadConfiguration(CLIConfig& config) {
    util::ConfigManager& settings = config.settings;

    for (const char* key : {util::ConfigKeys::DATADIR, util::ConfigKeys::CONF,
                            util::ConfigKeys::STORAGE, util::ConfigKeys::LOGLEVEL,
                            util::ConfigKeys::DEBUG, util::ConfigKeys::PRINTTOCONSOLE,
                            util::ConfigKeys::LOGFILE, util::ConfigKeys::TRUNCATENAMES,
                            util::ConfigKeys::CALLER}) {
        settings.AllowKey(key);
    }

    std::string dataDir = settings.GetPath(util::ConfigKeys::DATADIR,
                                           util::ConfigManager::GetDefaultDataDir());

    bool explicitConf = settings.HasKey(util::ConfigKeys::CONF);
    std::string confPath = settings.GetPath(
        util::ConfigKeys::CONF, dataDir + "/" + util::DEFAULT_CONFIG_FILENAME);

    if (explicitConf || std::filesystem::exists(confPath)) {
        util::ConfigParseResult result = settings.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error reading configuration: " << result.Describe() << "\n";
            return false;
        }
        for (const auto& warning : result.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }
    }

    for (const auto& problem : settings.Validate()) {
        std::cerr << "Warning: " << problem << "\n";
    }

    settings.SetDefault(util::ConfigKeys::STORAGE, db::HaveLevelDB() ? "leveldb" : "memory");
    // --debug without an explicit level means debug output
    settings.SetDefault(util::ConfigKeys::LOGLEVEL,
                        settings.HasKey(util::ConfigKeys::DEBUG) ? "debug" : "warn");
    settings.SetDefault(util::ConfigKeys::PRINTTOCONSOLE, "1");

    // The file may itself name a data directory
    config.dataDir = settings.GetPath(util::ConfigKeys::DATADIR, dataDir);
    config.storage = settings.GetString(util::ConfigKeys::STORAGE, "memory");
    config.truncateNames = settings.GetBool(util::ConfigKeys::TRUNCATENAMES, false);
    config.caller = settings.GetString(util::ConfigKeys::CALLER, "");

    if (config.storage != "leveldb" && config.storage != "memory") {
        std::cerr << "Error: unknown storage backend '" << config.storage << "'\n";
        return false;
    }
    if (config.storage == "leveldb" && !db::HaveLevelDB()) {
        std::cerr << "Error: this build has no LevelDB support, use --storage=memory\n";
        return false;
    }
    return true;
}

bool SetupLogging(const CLIConfig& config) {
    const util::ConfigManager& settings = config.settings;

    std::string levelName = settings.GetString(util::ConfigKeys::LOGLEVEL, "warn");
    auto level = util::LogLevelFromString(levelName);
    if (!level) {
        std::cerr << "Error: unknown log level '" << levelName << "'\n";
        return false;
    }

    util::LogOptions options;
    options.level = *level;
    options.categories = settings.GetList(util::ConfigKeys::DEBUG);
    options.printToConsole = settings.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);
    options.logFile = settings.GetPath(util::ConfigKeys::LOGFILE);

    util::Logger::Instance().Configure(options);
    LOG_DEBUG(util::LogCategory::CONFIG) << "Configuration:\n" << settings.Dump();
    return true;
}

// ============================================================================
// Session
// ============================================================================

/// Ballot state shared by the commands of one invocation
class Session {
public:
    explicit Session(const CLIConfig& config) : config_(config) {}

    /// Run one command; returns an exit code
    int Run(const std::string& caller, const std::string& command,
            const std::vector<std::string>& args);

private:
    std::pair<db::Status, std::unique_ptr<db::Database>> OpenStore() const;

    /// Load the ballot from storage unless already held
    int EnsureBallot();

    int Create(const Identity& caller, const std::vector<std::string>& args);
    int Report(const char* command, BallotError err) const;

    const CLIConfig& config_;
    std::unique_ptr<voting::Ballot> ballot_;
};

bool ParseIdentity(const std::string& text, Identity* id) {
    try {
        if (text.size() == Identity::SIZE * 2 &&
            std::all_of(text.begin(), text.end(),
                        [](unsigned char c) { return std::isxdigit(c) != 0; })) {
            *id = Identity::FromHex(text);
        } else {
            *id = Identity::FromLabel(text);
        }
        return true;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: bad identity '" << text << "': " << e.what() << "\n";
        return false;
    }
}

bool ParseIndex(const std::string& text, size_t* index) {
    if (text.empty() || text.size() > 10 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        std::cerr << "Error: bad proposal index '" << text << "'\n";
        return false;
    }
    *index = static_cast<size_t>(std::stoull(text));
    return true;
}

std::pair<db::Status, std::unique_ptr<db::Database>> Session::OpenStore() const {
    db::Options options;
    options.in_memory = (config_.storage == "memory");
    std::filesystem::path path = std::filesystem::path(config_.dataDir) / STORE_DIRNAME;
    return db::OpenDatabase(path, options);
}

int Session::Report(const char* command, BallotError err) const {
    if (err == BallotError::OK) {
        return EXIT_OK;
    }
    std::cerr << "error: " << command << ": " << BallotErrorToString(err) << "\n";
    if (err == BallotError::StorageError) {
        return EXIT_USAGE;
    }
    if (err == BallotError::NotInitialized) {
        std::cerr << "No ballot found in " << config_.dataDir
                  << " (" << config_.storage << " storage). Run 'create' first.\n";
        return EXIT_USAGE;
    }
    return EXIT_REJECTED;
}

int Session::EnsureBallot() {
    if (ballot_) {
        return EXIT_OK;
    }

    auto [status, store] = OpenStore();
    if (!status.ok()) {
        std::cerr << "error: cannot open store: " << status.ToString() << "\n";
        return EXIT_USAGE;
    }

    auto [err, opened] = voting::Ballot::Open(std::move(store));
    if (err != BallotError::OK) {
        return Report("open", err);
    }
    ballot_ = std::move(opened);
    return EXIT_OK;
}

int Session::Create(const Identity& caller, const std::vector<std::string>& args) {
    if (ballot_) {
        return Report("create", BallotError::InvalidInput);
    }
    if (args.empty()) {
        std::cerr << "Usage: create <name>...\n";
        return EXIT_USAGE;
    }

    auto [status, store] = OpenStore();
    if (!status.ok()) {
        std::cerr << "error: cannot open store: " << status.ToString() << "\n";
        return EXIT_USAGE;
    }

    voting::BallotOptions options;
    options.namePolicy = config_.truncateNames ? voting::NamePolicy::Truncate
                                               : voting::NamePolicy::Reject;

    auto [err, created] = voting::Ballot::Create(std::move(store), caller, args, options);
    if (err != BallotError::OK) {
        return Report("create", err);
    }
    ballot_ = std::move(created);

    std::cout << "created ballot with " << ballot_->GetProposalCount() << " proposal(s), "
              << "administrator " << caller.ToString()
              << " (" << ballot_->GetBackendName() << " storage)\n";
    return EXIT_OK;
}

int Session::Run(const std::string& callerText, const std::string& command,
                 const std::vector<std::string>& args) {
    if (command == "help") {
        PrintCommands();
        return EXIT_OK;
    }

    // Commands that need no caller
    const bool anonymous = command == "winner" || command == "winnername" ||
                           command == "proposals" || command == "proposal" ||
                           command == "audit";

    Identity caller;
    if (!anonymous) {
        if (callerText.empty()) {
            std::cerr << "Error: '" << command << "' needs a caller (--caller)\n";
            return EXIT_USAGE;
        }
        if (!ParseIdentity(callerText, &caller)) {
            return EXIT_USAGE;
        }
    }

    if (command == "create") {
        return Create(caller, args);
    }

    auto needArgs = [&](size_t n, const char* usage) {
        if (args.size() != n) {
            std::cerr << "Usage: " << usage << "\n";
            return false;
        }
        return true;
    };

    if (command == "giverights" || command == "delegate" || command == "weight" ||
        command == "voterinfo") {
        std::string usage = command + " <identity>";
        if (!needArgs(1, usage.c_str())) return EXIT_USAGE;
    } else if (command == "vote" || command == "proposal") {
        std::string usage = command + " <index>";
        if (!needArgs(1, usage.c_str())) return EXIT_USAGE;
    } else if (command == "winner" || command == "winnername" || command == "proposals" ||
               command == "hasvoted" || command == "voters" || command == "audit") {
        if (!needArgs(0, command.c_str())) return EXIT_USAGE;
    } else {
        std::cerr << "Error: unknown command '" << command << "'. Try 'help'.\n";
        return EXIT_USAGE;
    }

    int rc = EnsureBallot();
    if (rc != EXIT_OK) {
        return rc;
    }
    voting::Ballot& ballot = *ballot_;

    if (command == "giverights" || command == "delegate") {
        Identity other;
        if (!ParseIdentity(args[0], &other)) return EXIT_USAGE;
        BallotError err = command == "giverights" ? ballot.GiveRightToVote(caller, other)
                                                  : ballot.Delegate(caller, other);
        if (err == BallotError::OK) {
            std::cout << "ok\n";
        }
        return Report(command.c_str(), err);
    }

    if (command == "vote") {
        size_t index = 0;
        if (!ParseIndex(args[0], &index)) return EXIT_USAGE;
        BallotError err = ballot.Vote(caller, index);
        if (err == BallotError::OK) {
            std::cout << "ok\n";
        }
        return Report("vote", err);
    }

    if (command == "winner") {
        std::cout << ballot.WinningProposal() << "\n";
        return EXIT_OK;
    }

    if (command == "winnername") {
        std::cout << ballot.WinnerName() << "\n";
        return EXIT_OK;
    }

    if (command == "proposals") {
        auto proposals = ballot.GetProposals();
        for (size_t i = 0; i < proposals.size(); ++i) {
            std::cout << i << "  " << proposals[i].Name() << "  "
                      << proposals[i].voteCount << "\n";
        }
        return EXIT_OK;
    }

    if (command == "proposal") {
        size_t index = 0;
        if (!ParseIndex(args[0], &index)) return EXIT_USAGE;
        std::string name;
        Weight votes = 0;
        BallotError err = ballot.GetProposalName(index, &name);
        if (err == BallotError::OK) {
            err = ballot.GetProposalVotes(index, &votes);
        }
        if (err == BallotError::OK) {
            std::cout << "name: " << name << "\nvotes: " << votes << "\n";
        }
        return Report("proposal", err);
    }

    if (command == "hasvoted") {
        bool voted = false;
        BallotError err = ballot.HasVoted(caller, &voted);
        if (err == BallotError::OK) {
            std::cout << (voted ? "true" : "false") << "\n";
        }
        return Report("hasvoted", err);
    }

    if (command == "weight") {
        Identity voter;
        if (!ParseIdentity(args[0], &voter)) return EXIT_USAGE;
        Weight weight = 0;
        BallotError err = ballot.GetWeight(caller, voter, &weight);
        if (err == BallotError::OK) {
            std::cout << weight << "\n";
        }
        return Report("weight", err);
    }

    if (command == "voterinfo") {
        Identity voter;
        if (!ParseIdentity(args[0], &voter)) return EXIT_USAGE;
        voting::VotingRecord record;
        BallotError err = ballot.GetVoterInfo(caller, voter, &record);
        std::vector<Identity> chain;
        if (err == BallotError::OK) {
            err = ballot.GetDelegationChain(caller, voter, &chain);
        }
        if (err == BallotError::OK) {
            std::cout << "identity: " << voter.ToString() << "\n";
            std::cout << "state: " << voting::VoterStateToString(record.State()) << "\n";
            std::cout << "weight: " << record.weight << "\n";
            std::cout << "voted: " << (record.hasVoted ? "true" : "false") << "\n";
            if (record.delegate) {
                std::cout << "delegate: " << record.delegate->ToString() << "\n";
            }
            if (record.vote) {
                std::cout << "vote: " << *record.vote << "\n";
            }
            if (chain.size() > 1) {
                std::cout << "chain:";
                for (const auto& id : chain) {
                    std::cout << " " << id.ToString();
                }
                std::cout << "\n";
            }
        }
        return Report("voterinfo", err);
    }

    if (command == "voters") {
        std::vector<voting::VoterEntry> voters;
        BallotError err = ballot.ListVoters(caller, &voters);
        if (err == BallotError::OK) {
            for (const auto& entry : voters) {
                std::cout << entry.id.ToString() << "  "
                          << voting::VoterStateToString(entry.record.State()) << "  "
                          << entry.record.weight << "\n";
            }
        }
        return Report("voters", err);
    }

    // audit
    voting::WeightAudit audit;
    BallotError err = ballot.AuditWeight(&audit);
    if (err == BallotError::OK) {
        std::cout << "granted: " << audit.granted << "\n";
        std::cout << "resting: " << audit.resting << "\n";
        std::cout << "tallied: " << audit.tallied << "\n";
        std::cout << "records: " << audit.records << "\n";
        std::cout << "balanced: " << (audit.Balanced() ? "true" : "false") << "\n";
        if (!audit.Balanced()) {
            return EXIT_REJECTED;
        }
    }
    return Report("audit", err);
}

// ============================================================================
// Script Mode
// ============================================================================

/// Run "<caller> <command> [params]" lines; returns the worst exit code seen
int RunScript(Session& session, std::istream& in) {
    int worst = EXIT_OK;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        std::istringstream tokens(line);
        std::vector<std::string> words;
        std::string word;
        while (tokens >> word) {
            words.push_back(word);
        }
        if (words.empty() || words[0][0] == '#') {
            continue;
        }
        if (words.size() < 2) {
            std::cerr << "line " << lineNum << ": expected '<caller> <command> [params]'\n";
            worst = std::max(worst, EXIT_USAGE);
            continue;
        }

        std::vector<std::string> args(words.begin() + 2, words.end());
        int rc = session.Run(words[0], words[1], args);
        if (rc != EXIT_OK) {
            std::cerr << "line " << lineNum << ": exit " << rc << "\n";
        }
        worst = std::max(worst, rc);
    }
    return worst;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return EXIT_USAGE;
    }

    if (config.showHelp) {
        PrintHelp();
        return EXIT_OK;
    }
    if (config.showVersion) {
        PrintVersion();
        return EXIT_OK;
    }

    if (!config.stdinMode && config.command.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'ballot-cli --help' for usage information.\n";
        return EXIT_USAGE;
    }
    if (config.stdinMode && !config.command.empty()) {
        std::cerr << "Error: --stdin takes its commands from standard input only.\n";
        return EXIT_USAGE;
    }

    if (!LoadConfiguration(config) || !SetupLogging(config)) {
        return EXIT_USAGE;
    }

    Session session(config);
    int rc = config.stdinMode ? RunScript(session, std::cin)
                              : session.Run(config.caller, config.command, config.args);

    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace cli
} // namespace ballot

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return ballot::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
