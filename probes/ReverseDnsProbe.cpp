#include "ReverseDnsProbe.hpp"
#include "../common/Log.hpp"
#include "../common/SocketUtils.hpp"
#include "../common/TextParsers.hpp"
#include "../engine/Deadline.hpp"

#include <algorithm>
#include <cctype>
#include <netdb.h>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;
    using engine::Remaining;

    namespace
    {
        using Clock = std::chrono::steady_clock;

        constexpr auto TOOL_TIMEOUT = std::chrono::milliseconds(3000);
        constexpr auto AVAILABILITY_TIMEOUT = std::chrono::milliseconds(2000);

        struct Category
        {
            const char *label;
            std::vector<const char *> needles;
        };

        const std::vector<Category> &Categories()
        {
            static const std::vector<Category> categories = {
                {"Router/Gateway", {"router", "gateway", "gw", "modem"}},
                {"Apple Device", {"iphone", "ipad", "macbook", "imac", "mac-", "appletv"}},
                {"Android Device", {"android", "samsung", "xiaomi", "huawei", "oneplus"}},
                {"Computer", {"pc", "desktop", "laptop", "computer", "win", "ubuntu", "linux"}},
                {"Printer", {"printer", "print", "hp-", "canon", "epson"}},
                {"NAS/Storage", {"nas", "storage", "synology", "qnap", "drobo"}},
                {"Smart TV", {"tv", "smart", "roku", "chromecast", "firetv"}},
                {"IP Camera", {"camera", "cam", "webcam", "ipcam"}},
                {"Game Console", {"xbox", "playstation", "ps4", "ps5", "nintendo", "switch"}},
            };
            return categories;
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool EndsWith(const std::string &s, const std::string &suffix)
        {
            return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::optional<std::string> Usable(std::optional<std::string> name, const std::string &address)
        {
            if (!name)
                return std::nullopt;
            if (!name->empty() && name->back() == '.')
                name->pop_back();
            if (name->empty() || *name == address || name->find(".arpa") != std::string::npos)
                return std::nullopt;
            return name;
        }

        std::optional<std::string> SystemResolver(const std::string &address)
        {
            sockaddr_storage storage{};
            socklen_t length = 0;
            if (!common::MakeSockAddr(address, 0, storage, length))
                return std::nullopt;

            char host[NI_MAXHOST] = {};
            int rc = getnameinfo(reinterpret_cast<sockaddr *>(&storage), length, host, sizeof(host), nullptr, 0, NI_NAMEREQD);
            if (rc != 0)
                return std::nullopt;
            return std::string(host);
        }
    }

    std::string ExtractDomain(const std::string &hostname)
    {
        auto last = hostname.rfind('.');
        if (last == std::string::npos || last == 0)
            return hostname;
        auto previous = hostname.rfind('.', last - 1);
        if (previous == std::string::npos)
            return hostname;
        return hostname.substr(previous + 1);
    }

    std::string ClassifyHostname(const std::string &hostname)
    {
        const std::string name = Lower(hostname);
        for (const auto &category : Categories())
        {
            for (const char *needle : category.needles)
            {
                if (name.find(needle) != std::string::npos)
                    return category.label;
            }
        }
        return "Unknown Device";
    }

    bool IsLocalDomain(const std::string &hostname)
    {
        static const std::vector<std::string> suffixes = {
            ".local", ".lan", ".home", ".internal", ".private", ".localdomain"};
        const std::string name = Lower(hostname);
        return std::any_of(suffixes.begin(), suffixes.end(), [&](const std::string &suffix)
                           { return EndsWith(name, suffix); });
    }

    std::optional<std::string> ResolveHostname(common::CommandRunner &runner, const std::string &address,
                                               std::chrono::milliseconds timeout)
    {
        const auto deadline = Clock::now() + timeout;

        auto resolved = engine::RunWithDeadline<std::string>([address]()
                                                             { return SystemResolver(address); },
                                                             timeout / 2);
        if (auto name = Usable(resolved, address))
            return name;

        auto budget = std::min(Remaining(deadline), TOOL_TIMEOUT);
        if (budget.count() == 0)
            return std::nullopt;
        auto nslookup = runner.Run({"nslookup", address}, budget);
        if (nslookup.Succeeded())
        {
            if (auto name = Usable(common::parsers::ParseNslookupOutput(nslookup.output), address))
                return name;
        }

        budget = std::min(Remaining(deadline), TOOL_TIMEOUT);
        if (budget.count() == 0)
            return std::nullopt;
        auto dig = runner.Run({"dig", "-x", address, "+short"}, budget);
        if (dig.Succeeded())
            return Usable(common::parsers::ParseDigShortOutput(dig.output), address);
        return std::nullopt;
    }

    ReverseDnsProbe::ReverseDnsProbe(engine::ProbeConfig config, std::shared_ptr<common::CommandRunner> runner)
        : Probe(std::move(config)), m_runner(std::move(runner))
    {
    }

    bool ReverseDnsProbe::IsAvailable()
    {
        auto resolved = engine::RunWithDeadline<bool>([]() -> std::optional<bool>
                                                      {
                                                          addrinfo hints{};
                                                          hints.ai_family = AF_UNSPEC;
                                                          addrinfo *list = nullptr;
                                                          if (getaddrinfo("localhost", nullptr, &hints, &list) != 0)
                                                              return false;
                                                          freeaddrinfo(list);
                                                          return true; },
                                                      AVAILABILITY_TIMEOUT);
        return resolved.value_or(false);
    }

    std::optional<engine::ProbeResult> ReverseDnsProbe::ProbeOne(const engine::ScanTarget &target)
    {
        const auto start = Clock::now();
        auto hostname = ResolveHostname(*m_runner, target.address, m_config.timeout);
        if (!hostname)
            return std::nullopt;

        std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
        Log(LogLevel::Debug, "Dns") << target.address << " -> " << *hostname;

        auto result = engine::MakeResult(target, Kind(), elapsed.count());
        result.hostname = *hostname;
        result.metadata["domain"] = ExtractDomain(*hostname);
        result.metadata["device_type"] = ClassifyHostname(*hostname);
        result.metadata["is_local"] = IsLocalDomain(*hostname) ? "true" : "false";
        return result;
    }
}
