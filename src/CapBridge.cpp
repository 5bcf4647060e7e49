#include "BridgeConfig.hpp"
#include "HostServices.hpp"
#include "LuaEngine.hpp"
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace CapBridge;

static bool readFile(const std::string &path, std::string &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char **argv)
{
    if (argc < 4 || argc > 5)
    {
        std::cerr << "usage: " << argv[0] << " <script.lua> <user> <password> [config.json]" << std::endl;
        return 2;
    }

    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::info, &consoleAppender);

    BridgeConfig config;
    if (argc == 5)
    {
        std::string err;
        if (!BridgeConfig::loadFile(argv[4], config, &err))
        {
            PLOGE << "config: " << err;
            return 2;
        }
    }
    plog::get()->setMaxSeverity(plog::severityFromString(config.logLevel.c_str()));

    std::string code;
    if (!readFile(argv[1], code))
    {
        PLOGE << "cannot read script " << argv[1];
        return 2;
    }

    try
    {
        LuaEngine engine(config, HostServices::defaults(config));
        if (!engine.loadScript(code, std::string("@") + argv[1]))
        {
            std::cerr << "error: " << engine.lastError() << std::endl;
            return 2;
        }
        std::string d = engine.descr();
        if (!d.empty())
            std::cout << "descr: " << d << std::endl;

        std::optional<bool> ok = engine.verify(argv[2], argv[3]);
        if (!ok)
        {
            std::cerr << "error: " << engine.lastError() << std::endl;
            return 2;
        }
        std::cout << (*ok ? "valid" : "invalid") << std::endl;
        return *ok ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        PLOGE << "fatal: " << e.what();
        return 2;
    }
}
