#include "LuaSystemBindings.hpp"
#include "CapabilityRegistry.hpp"
#include "CryptoHelpers.hpp"
#include "ProcessRunner.hpp"
#include <plog/Log.h>
#include <chrono>
#include <thread>

namespace CapBridge {

// execve arguments must all be text; anything else is a script bug
static std::vector<std::string> processArgs(const DynamicValue &table)
{
    if (!table.isSequence())
        throw ArgumentError("execve arguments must be a sequence of strings");
    std::vector<std::string> out;
    out.reserve(table.asTable().size());
    size_t i = 1;
    for (const auto &kv : table.asTable())
    {
        if (!kv.second.isText())
            throw ArgumentError("execve argument #" + std::to_string(i) + " must be a string, got "
                                + DynamicValue::typeName(kv.second.type()));
        out.push_back(kv.second.asText());
        ++i;
    }
    return out;
}

void registerLuaSystemBindings(CapabilityRegistry &reg, MySQLProbe probe, const MySQLSettings &mysql, PrintSink sink)
{
    ErrorSlot &errors = reg.errors();

    CapabilityDescriptor exec;
    exec.name = "execve";
    exec.params = {{"program", ParamType::Text}, {"args", ParamType::Table}};
    exec.handler = [&errors](const CallArgs &args) -> CapabilityResult {
        std::vector<std::string> argv = processArgs(args.table(1));
        int code = 0;
        std::string err;
        if (!runProcess(args.text(0), argv, code, &err))
            return errors.set(BridgeError(BridgeError::Kind::Process, err));
        return DynamicValue::number(code);
    };
    exec.signature = "execve(program, args) -> exit code|nil";
    exec.summary = "Run a program from PATH and wait for it. A non-zero exit code is not a failure.";
    exec.example = "return execve(\"/usr/local/bin/check-user\", {user}) == 0";
    exec.sourceFile = __FILE__;
    reg.add(std::move(exec));

    CapabilityDescriptor rnd;
    rnd.name = "rand";
    rnd.params = {{"min", ParamType::Integer}, {"max", ParamType::Integer}};
    rnd.handler = [](const CallArgs &args) -> CapabilityResult {
        int64_t lo = args.integer(0);
        int64_t hi = args.integer(1);
        if (lo < 0 || hi > 4294967296LL || lo >= hi)
            throw ArgumentError("rand expects 0 <= min < max <= 2^32, got " + std::to_string(lo) + ", " + std::to_string(hi));
        return DynamicValue::number(CryptoHelpers::randomInRange(static_cast<uint32_t>(lo), static_cast<uint64_t>(hi)));
    };
    rnd.signature = "rand(min, max) -> integer";
    rnd.summary = "Uniform random integer in [min, max).";
    rnd.example = "sleep(rand(1, 4))";
    rnd.sourceFile = __FILE__;
    reg.add(std::move(rnd));

    CapabilityDescriptor slp;
    slp.name = "sleep";
    slp.params = {{"seconds", ParamType::Integer}};
    slp.returnsValue = false;
    slp.handler = [](const CallArgs &args) -> CapabilityResult {
        int64_t secs = args.integer(0);
        if (secs < 0)
            throw ArgumentError("sleep expects a non-negative number of seconds");
        std::this_thread::sleep_for(std::chrono::seconds(secs));
        return DynamicValue();
    };
    slp.signature = "sleep(seconds)";
    slp.summary = "Block the script for whole seconds.";
    slp.example = "sleep(1)";
    slp.sourceFile = __FILE__;
    reg.add(std::move(slp));

    CapabilityDescriptor prn;
    prn.name = "print";
    prn.params = {{"value", ParamType::Any}};
    prn.returnsValue = false;
    prn.handler = [sink](const CallArgs &args) -> CapabilityResult {
        std::string line = formatDebug(args.value(0));
        PLOGI << "lua: " << line;
        if (sink) sink(line);
        return DynamicValue();
    };
    prn.signature = "print(value)";
    prn.summary = "Debug output of any value.";
    prn.example = "print({status=resp.status})";
    prn.sourceFile = __FILE__;
    reg.add(std::move(prn));

    CapabilityDescriptor last;
    last.name = "last_err";
    last.handler = [&errors](const CallArgs &) -> CapabilityResult {
        auto msg = errors.last();
        if (!msg) return DynamicValue();
        return DynamicValue::text(*msg);
    };
    last.signature = "last_err() -> text|nil";
    last.summary = "Message of the most recent failed capability call.";
    last.example = "local r = http_send(req)\nif not r then print(last_err()) end";
    last.sourceFile = __FILE__;
    reg.add(std::move(last));

    CapabilityDescriptor my;
    my.name = "mysql_connect";
    my.params = {{"host", ParamType::Text}, {"port", ParamType::Integer}, {"user", ParamType::Text}, {"password", ParamType::Text}};
    my.handler = [probe, mysql, &errors](const CallArgs &args) -> CapabilityResult {
        int64_t port = args.integer(1);
        if (port < 1 || port > 65535)
            throw ArgumentError("port out of range: " + std::to_string(port));

        DBConnectionInfo info;
        info.mysql_host = args.text(0);
        info.mysql_port = static_cast<int>(port);
        info.mysql_user = args.text(2);
        info.mysql_password = args.text(3);
        info.mysql_use_ssl = mysql.useSSL;
        info.connect_timeout_seconds = mysql.timeoutSeconds;

        std::string err;
        switch (probe(info, err))
        {
        case MySQLProbeResult::Connected:
            return DynamicValue::boolean(true);
        case MySQLProbeResult::Rejected:
            PLOGD << "mysql_connect " << info.mysql_host << ": " << err;
            return DynamicValue::boolean(false);
        case MySQLProbeResult::Unreachable:
            break;
        }
        return errors.set(BridgeError(BridgeError::Kind::TransportError, err));
    };
    my.signature = "mysql_connect(host, port, user, password) -> bool|nil";
    my.summary = "Try to log into a MySQL server over the X protocol. false when the login is rejected.";
    my.example = "return mysql_connect(\"127.0.0.1\", 33060, user, password)";
    my.sourceFile = __FILE__;
    reg.add(std::move(my));
}

} // namespace CapBridge
