#include "../../include/riskgov/util/input_parser.hpp"
#include "../../include/riskgov/errors.hpp"

#include <nlohmann/json.hpp>

namespace riskgov::util {

using json = nlohmann::json;

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

double required_number(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        throw ParseError(std::string("signal: ") + key + " must be a number");
    }
    return it->get<double>();
}

Command parse_command(const std::string& name) {
    if (name == "reset_halt")
        return Command::ResetHalt;
    if (name == "daily_reset")
        return Command::DailyReset;
    if (name == "kill")
        return Command::Kill;
    if (name == "clear_kill")
        return Command::ClearKill;
    throw ParseError("unknown command " + name);
}

} // namespace

InputLine parse_input_line(const std::string& line) {
    InputLine out;
    if (is_blank(line))
        return out;

    json doc;
    try {
        doc = json::parse(line);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("input: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ParseError("input: expected a JSON object");
    }

    auto cmd = doc.find("command");
    if (cmd != doc.end()) {
        if (!cmd->is_string())
            throw ParseError("input: command must be a string");
        out.command = parse_command(cmd->get<std::string>());
        return out;
    }

    auto symbol = doc.find("symbol");
    auto action = doc.find("action");
    if (symbol == doc.end() || !symbol->is_string())
        throw ParseError("signal: symbol must be a string");
    if (action == doc.end() || !action->is_string())
        throw ParseError("signal: action must be a string");

    Signal sig;
    sig.symbol = symbol->get<std::string>();
    const std::string side = action->get<std::string>();
    if (side == "buy" || side == "BUY") {
        sig.action = Side::Buy;
    } else if (side == "sell" || side == "SELL") {
        sig.action = Side::Sell;
    } else {
        throw ParseError("signal: unknown action " + side);
    }
    sig.price = required_number(doc, "price");
    sig.requested_size = required_number(doc, "size");
    sig.confidence = doc.contains("confidence") ? required_number(doc, "confidence") : 1.0;

    out.signal = sig;
    return out;
}

} // namespace riskgov::util
