// TIERPOOL - Scenario Runner
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Drives a PoolEngine over in-memory collaborators from a line-oriented
// script. Participant names map to identities by Hash160(name).
//
// Usage: tierpool-sim [-conf=<file>] [-loglevel=<level>] [script]
//        (reads the script from stdin when no file is given)

#include "tierpool/crypto/hash.h"
#include "tierpool/pool/params.h"
#include "tierpool/pool/pool.h"
#include "tierpool/pool/simulation.h"
#include "tierpool/util/config.h"
#include "tierpool/util/logging.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace tierpool;

namespace {

/// Name given to the operator when the config names none
constexpr const char* DEFAULT_OPERATOR_NAME = "operator";

/// Balance minted to a participant before their first deposit
constexpr Amount FAUCET_AMOUNT = 1000000LL * COIN;

void PrintUsage() {
    std::cout << "Usage: tierpool-sim [options] [script]\n"
              << "\n"
              << "Options:\n"
              << "  -conf=<file>       Read configuration from file\n"
              << "  -loglevel=<level>  trace, debug, info, warn, error\n"
              << "  -log.<category>=<level>\n"
              << "                     Override the level of pool, epoch, reward,\n"
              << "                     auth, config or sim\n"
              << "  -help              Show this message\n"
              << "\n"
              << "Script commands:\n"
              << "  epoch <n>                 Set the oracle epoch\n"
              << "  offline | online          Toggle oracle availability\n"
              << "  deposit <name> <amount>   Stake amount\n"
              << "  request <name> <amount>   Queue a withdrawal\n"
              << "  complete <name>           Release matured withdrawals\n"
              << "  emergency <name>          Withdraw everything now\n"
              << "  reward <amount>           Queue a settlement payment\n"
              << "  claim [epochIds...]       Claim and distribute rewards\n"
              << "  claimuser <name>          Pay out a participant's reward\n"
              << "  submit <text>             Submit a work payload\n"
              << "  fee <bps>                 Set the operator fee\n"
              << "  propose <name>            Propose a new operator\n"
              << "  accept <name>             Accept the operator role\n"
              << "  pause | unpause           Toggle the pause gate\n"
              << "  process                   Process the current epoch\n"
              << "  info                      Print pool state\n"
              << "  user <name>               Print a participant\n";
}

bool ParseAmount(const std::string& text, Amount& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<Amount>(value);
    return true;
}

bool ParseEpoch(const std::string& text, Epoch& out) {
    if (text.empty() || text[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<Epoch>(value);
    return true;
}

Address NameToAddress(const std::string& name) {
    return ComputeHash160(name);
}

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.ResetCategoryLevels();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString("loglevel", config.GetString("level", "warn", "log")));
    logger.SetLevel(level);

    // [log] pool=debug and friends override the global level per subsystem
    for (const char* category : util::LogCategory::CONFIGURABLE) {
        if (auto value = config.TryGetString(category, "log")) {
            logger.SetCategoryLevel(category, util::LogLevelFromString(*value));
        }
    }

    if (config.GetBool("console", true, "log")) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = util::LogLevel::Trace;
        consoleConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetString("file", "", "log");
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<util::FileSink>(logFile);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << logFile << "\n";
        }
    }
}

// ============================================================================
// Scenario
// ============================================================================

class Scenario {
public:
    explicit Scenario(const pool::PoolParams& params)
        : assets_(params.poolAddress)
        , settlement_(assets_)
        , engine_(params, assets_, settlement_, oracle_) {
        engine_.SetEventCallback([](const pool::PoolEvent& event) {
            std::cout << "  event " << event.ToString() << "\n";
        });
    }

    /// Execute one script line; false on a malformed command
    bool Run(const std::string& line);

private:
    void Fund(const Address& who, Amount amount) {
        if (assets_.BalanceOf(who) < amount && !assets_.Mint(who, FAUCET_AMOUNT)) {
            std::cout << "  faucet mint failed\n";
        }
    }

    pool::InMemoryAssetLedger assets_;
    pool::ManualEpochOracle oracle_;
    pool::ScriptedSettlement settlement_;
    pool::PoolEngine engine_;
};

bool Scenario::Run(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd) || cmd[0] == '#') {
        return true;
    }

    std::vector<std::string> args;
    for (std::string arg; iss >> arg;) {
        args.push_back(arg);
    }

    const Address op = engine_.GetState().access.GetOperator();
    Amount amount = 0;
    Epoch epoch = 0;

    std::cout << "> " << line << "\n";

    if (cmd == "epoch" && args.size() == 1 && ParseEpoch(args[0], epoch)) {
        oracle_.Set(epoch);
        std::cout << "  oracle epoch " << oracle_.Peek() << "\n";
    } else if (cmd == "offline" && args.empty()) {
        oracle_.SetAvailable(false);
    } else if (cmd == "online" && args.empty()) {
        oracle_.SetAvailable(true);
    } else if (cmd == "deposit" && args.size() == 2 && ParseAmount(args[1], amount)) {
        Address who = NameToAddress(args[0]);
        Fund(who, amount);
        std::cout << "  " << engine_.Deposit(who, amount).ToString() << "\n";
    } else if (cmd == "request" && args.size() == 2 && ParseAmount(args[1], amount)) {
        std::cout << "  " << engine_.RequestWithdrawal(NameToAddress(args[0]), amount).ToString()
                  << "\n";
    } else if (cmd == "complete" && args.size() == 1) {
        std::cout << "  " << engine_.CompleteWithdrawal(NameToAddress(args[0])).ToString() << "\n";
    } else if (cmd == "emergency" && args.size() == 1) {
        std::cout << "  " << engine_.EmergencyWithdraw(NameToAddress(args[0])).ToString() << "\n";
    } else if (cmd == "reward" && args.size() == 1 && ParseAmount(args[0], amount)) {
        settlement_.QueueReward(amount);
        std::cout << "  queued " << amount << "\n";
    } else if (cmd == "claim") {
        std::vector<uint64_t> epochIds;
        for (const auto& arg : args) {
            if (!ParseEpoch(arg, epoch)) return false;
            epochIds.push_back(epoch);
        }
        std::cout << "  " << engine_.ClaimRewards(op, epochIds).ToString() << "\n";
    } else if (cmd == "claimuser" && args.size() == 1) {
        std::cout << "  " << engine_.ClaimUserRewards(NameToAddress(args[0])).ToString() << "\n";
    } else if (cmd == "submit" && args.size() == 1) {
        std::vector<Byte> payload(args[0].begin(), args[0].end());
        std::cout << "  " << engine_.SubmitWork(op, payload).ToString() << "\n";
    } else if (cmd == "fee" && args.size() == 1 && ParseAmount(args[0], amount)) {
        std::cout << "  " << engine_.SetFee(op, static_cast<int>(amount)).ToString() << "\n";
    } else if (cmd == "propose" && args.size() == 1) {
        std::cout << "  " << engine_.ProposeOperator(op, NameToAddress(args[0])).ToString()
                  << "\n";
    } else if (cmd == "accept" && args.size() == 1) {
        std::cout << "  " << engine_.AcceptOperator(NameToAddress(args[0])).ToString() << "\n";
    } else if (cmd == "pause" && args.empty()) {
        std::cout << "  " << engine_.Pause(op).ToString() << "\n";
    } else if (cmd == "unpause" && args.empty()) {
        std::cout << "  " << engine_.Unpause(op).ToString() << "\n";
    } else if (cmd == "process" && args.empty()) {
        pool::EpochResult r = engine_.ProcessEpoch();
        if (r) {
            std::cout << "  epoch " << r.epoch << (r.advanced ? " processed, " : " unchanged, ")
                      << r.promoted << " promoted\n";
        } else {
            std::cout << "  " << pool::PoolErrorToString(r.error) << ": " << r.message << "\n";
        }
    } else if (cmd == "info" && args.empty()) {
        std::cout << engine_.GetPoolInfo().ToString() << "\n";
    } else if (cmd == "user" && args.size() == 1) {
        std::cout << "  " << args[0] << ": "
                  << engine_.GetParticipant(NameToAddress(args[0])).ToString()
                  << " wallet=" << assets_.BalanceOf(NameToAddress(args[0])) << "\n";
    } else {
        return false;
    }

    std::string error;
    if (!engine_.CheckInvariants(&error)) {
        std::cout << "  INVARIANT VIOLATION: " << error << "\n";
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // A first pass over the command line only locates the config file
    util::ConfigManager args;
    util::ConfigParseResult cmdline = args.ParseCommandLine(argc, argv);
    if (!cmdline.success) {
        std::cerr << "Error: " << cmdline.ToString() << "\n";
        return 1;
    }
    if (args.HasKey("help") || args.HasKey("h")) {
        PrintUsage();
        return 0;
    }

    util::ConfigManager config;
    std::string confFile = args.GetString("conf", "");
    if (!confFile.empty()) {
        util::ConfigParseResult parsed = config.ParseFile(confFile);
        if (!parsed.success) {
            std::cerr << "Error: " << parsed.ToString() << "\n";
            return 1;
        }
    }

    // Command-line values override the file
    cmdline = config.ParseCommandLine(argc, argv);
    if (!cmdline.success) {
        std::cerr << "Error: " << cmdline.ToString() << "\n";
        return 1;
    }

    SetupLogging(config);

    if (!config.HasKey("operator", pool::POOL_CONFIG_SECTION)) {
        config.Set("operator", NameToAddress(DEFAULT_OPERATOR_NAME).ToHex(),
                   pool::POOL_CONFIG_SECTION);
    }
    pool::PoolParamsResult loaded = pool::LoadPoolParams(config);
    if (!loaded.success) {
        std::cerr << "Error: " << loaded.error << "\n";
        return 1;
    }

    std::unique_ptr<std::ifstream> scriptFile;
    std::istream* input = &std::cin;
    const auto& positional = config.GetPositionalArgs();
    if (!positional.empty()) {
        scriptFile = std::make_unique<std::ifstream>(positional.front());
        if (!scriptFile->is_open()) {
            std::cerr << "Error: cannot open script " << positional.front() << "\n";
            return 1;
        }
        input = scriptFile.get();
    }

    Scenario scenario(loaded.params);
    LOG_INFO(util::LogCategory::SIM) << "Scenario started";

    int lineNo = 0;
    int errors = 0;
    for (std::string line; std::getline(*input, line);) {
        ++lineNo;
        if (!scenario.Run(line)) {
            std::cerr << "line " << lineNo << ": cannot parse '" << line << "'\n";
            ++errors;
        }
    }

    LOG_INFO(util::LogCategory::SIM) << "Scenario finished, " << lineNo << " line(s), "
                                     << errors << " error(s)";
    util::Logger::Instance().Shutdown();
    return errors == 0 ? 0 : 2;
}
