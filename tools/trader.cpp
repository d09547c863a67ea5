/**
 * Risk Governor Trader
 *
 * Reads NDJSON signals and operator commands from stdin and runs one
 * governor cycle per line. Idle seconds still run a cycle so mode
 * transitions, daily boundaries and reports happen without input.
 *
 * Usage:
 *   strategy | riskgov_trader --config governor.json
 */

#include "../include/riskgov/config/config.hpp"
#include "../include/riskgov/errors.hpp"
#include "../include/riskgov/exchange/http_transport.hpp"
#include "../include/riskgov/exchange/live_client.hpp"
#include "../include/riskgov/exchange/paper_simulator.hpp"
#include "../include/riskgov/exchange/retry_policy.hpp"
#include "../include/riskgov/execution/executor.hpp"
#include "../include/riskgov/logging/async_logger.hpp"
#include "../include/riskgov/trading/mode_machine.hpp"
#include "../include/riskgov/trading/promotion.hpp"
#include "../include/riskgov/trading/reporter.hpp"
#include "../include/riskgov/trading/trading_state.hpp"
#include "../include/riskgov/util/cli.hpp"
#include "../include/riskgov/util/input_parser.hpp"
#include "../include/riskgov/util/system.hpp"
#include "../include/riskgov/util/time_utils.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <poll.h>
#include <string>
#include <unistd.h>

using namespace riskgov;

// ============================================================================
// Global State
// ============================================================================

std::atomic<bool> g_running{true};

// ============================================================================
// Stdin line reader
// ============================================================================

/**
 * Non-blocking line reader over a file descriptor.
 * Waits at most timeout_ms for input so the loop keeps ticking.
 */
class LineReader {
public:
    explicit LineReader(int fd) : fd_(fd) {}

    enum class Result { Line, Idle, Eof };

    Result next(std::string& line, int timeout_ms) {
        if (take_line(line))
            return Result::Line;
        if (eof_)
            return flush_tail(line);

        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc <= 0)
            return Result::Idle; // timeout or EINTR

        char chunk[4096];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0)
            return errno == EINTR || errno == EAGAIN ? Result::Idle : Result::Eof;
        if (n == 0) {
            eof_ = true;
            return flush_tail(line);
        }
        pending_.append(chunk, static_cast<size_t>(n));
        return take_line(line) ? Result::Line : Result::Idle;
    }

private:
    bool take_line(std::string& line) {
        auto pos = pending_.find('\n');
        if (pos == std::string::npos)
            return false;
        line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        return true;
    }

    Result flush_tail(std::string& line) {
        if (pending_.empty())
            return Result::Eof;
        line.swap(pending_);
        pending_.clear();
        return Result::Line;
    }

    int fd_;
    bool eof_ = false;
    std::string pending_;
};

// ============================================================================
// Setup
// ============================================================================

using util::CLIArgs;
using util::parse_args;
using util::print_help;

static ConfigPtr load_config(const CLIArgs& args) {
    Config cfg = args.config_path.empty() ? Config::defaults() : Config::from_json_file(args.config_path);
    cfg.apply_env();
    util::apply_cli(args, cfg);
    return std::make_shared<const Config>(cfg);
}

static exchange::RetryPolicy make_retry_policy(const ExecutionSettings& exec) {
    exchange::RetryPolicy::Settings settings;
    settings.max_attempts = exec.retry_attempts;
    settings.base_delay = std::chrono::milliseconds(exec.retry_base_delay_ms);
    settings.max_delay = std::chrono::milliseconds(exec.retry_max_delay_ms);
    return exchange::RetryPolicy(settings);
}

static exchange::LiveClient::StatusPolling make_status_polling(const ExecutionSettings& exec) {
    exchange::LiveClient::StatusPolling polling;
    polling.max_polls = exec.fill_poll_attempts;
    polling.interval = std::chrono::milliseconds(exec.fill_poll_interval_ms);
    return polling;
}

static trading::Reporter::Sink make_report_sink(const ExecutionSettings& exec) {
    trading::Reporter::Sink stdout_sink = [](const std::string& report) { std::cout << report << std::endl; };
    if (exec.report_dir.empty())
        return stdout_sink;
    return trading::Reporter::tee({stdout_sink, trading::Reporter::file_sink(exec.report_dir)});
}

// ============================================================================
// Main loop
// ============================================================================

static void handle_command(util::Command cmd, execution::Executor& executor, trading::KillSwitch& kill_switch,
                           logging::AsyncLogger& logger) {
    Timestamp now = util::wall_clock_ns();
    switch (cmd) {
    case util::Command::None:
        break;
    case util::Command::ResetHalt:
        if (kill_switch.asserted() && executor.config().limits.kill_switch_enabled) {
            RISKGOV_LOG(&logger, Warn, Mode, "reset_halt refused: kill switch still asserted");
        } else if (!executor.reset_halt(now)) {
            RISKGOV_LOG(&logger, Info, Mode, "reset_halt ignored: not halted");
        }
        break;
    case util::Command::DailyReset:
        executor.on_daily_boundary();
        break;
    case util::Command::Kill:
        kill_switch.assert_kill();
        RISKGOV_LOG(&logger, Warn, System, "kill switch asserted by operator");
        break;
    case util::Command::ClearKill:
        kill_switch.clear();
        RISKGOV_LOG(&logger, Warn, System, "kill switch cleared by operator");
        break;
    }
}

static int run(const CLIArgs& args) {
    ConfigPtr config;
    try {
        config = load_config(args);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // A closed stdout or socket must surface as EPIPE, not kill the process
    util::ignore_sigpipe();

    auto logger = std::make_unique<logging::AsyncLogger>();
    logger->set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Info);
    logger->start();

    trading::KillSwitch kill_switch;
    util::install_kill_switch_handler(kill_switch);

    // Paper client: never touches the network
    exchange::PaperSimulator paper(config->execution.paper_commission_rate);

    // Live client only when fully configured
    std::unique_ptr<exchange::LiveClient> live;
    if (config->live.complete()) {
        try {
            live = std::make_unique<exchange::LiveClient>(
                config->live, std::make_unique<exchange::CurlTransport>(config->execution.request_timeout_sec),
                make_retry_policy(config->execution), make_status_polling(config->execution));
            // No new attempt is dispatched once the kill switch is asserted
            const bool kill_enabled = config->limits.kill_switch_enabled;
            live->retry_policy().set_abort_predicate(
                [&kill_switch, kill_enabled]() { return kill_enabled && kill_switch.asserted(); });
            live->retry_policy().set_retry_callback([&logger](uint32_t attempt, const NetworkError& e) {
                RISKGOV_LOGF(logger.get(), Warn, Exchange, "retry after attempt %u: %s", attempt, e.what());
            });
        } catch (const std::exception& e) {
            RISKGOV_LOGF(logger.get(), Error, System, "live client disabled: %s", e.what());
            live.reset();
        }
    } else if (config->live_trading_authorized) {
        RISKGOV_LOG(logger.get(), Warn, System, "live trading authorized but NDAX credentials incomplete");
    }

    if (config->mode == Mode::LiveLimited && !live) {
        RISKGOV_LOG(logger.get(), Error, System, "mode LIVE_LIMITED requires a working live client");
        logger->stop();
        std::cerr << "mode LIVE_LIMITED requires complete NDAX credentials\n";
        return 1;
    }

    Timestamp start = util::wall_clock_ns();

    trading::TradingState state;
    state.init(config->initial_capital, config->mode);

    trading::PromotionEngine promotion;
    execution::Executor executor(config, state, promotion, paper, live.get(), &kill_switch, logger.get(), start);

    trading::Reporter reporter(static_cast<Timestamp>(config->execution.report_interval_sec) * NS_PER_SECOND,
                               make_report_sink(config->execution), logger.get());

    util::DailyBoundary boundary(start);
    util::install_shutdown_handler(g_running);

    RISKGOV_LOGF(logger.get(), Info, System, "started mode=%s capital=%.2f live=%s authorized=%d",
                 mode_to_string(state.mode), state.capital, live ? "yes" : "no",
                 config->live_trading_authorized ? 1 : 0);

    LineReader reader(STDIN_FILENO);
    std::string line;
    while (g_running.load()) {
        LineReader::Result r = reader.next(line, 1000);
        if (r == LineReader::Result::Eof)
            break;

        Timestamp now = util::wall_clock_ns();
        if (boundary.crossed(now)) {
            executor.on_daily_boundary();
        }

        std::optional<Signal> signal;
        if (r == LineReader::Result::Line) {
            try {
                util::InputLine input = util::parse_input_line(line);
                if (input.command != util::Command::None) {
                    handle_command(input.command, executor, kill_switch, *logger);
                }
                signal = input.signal;
            } catch (const ParseError& e) {
                RISKGOV_LOGF(logger.get(), Warn, System, "bad input line: %s", e.what());
            }
        }

        executor.execute_cycle(signal, now);

        if (reporter.due(now)) {
            reporter.emit(executor.state(), executor.config().limits, now);
        }
    }

    Timestamp end = util::wall_clock_ns();
    reporter.emit(executor.state(), executor.config().limits, end);
    RISKGOV_LOGF(logger.get(), Info, System, "shutdown mode=%s capital=%.2f cycles=%llu",
                 mode_to_string(executor.state().mode), executor.state().capital,
                 static_cast<unsigned long long>(executor.cycle_count()));
    logger->stop();
    return 0;
}

int main(int argc, char* argv[]) {
    CLIArgs args;
    if (!parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        print_help();
        return 0;
    }

    return run(args);
}
