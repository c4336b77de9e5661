#pragma once

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

namespace net_scan::testing
{
    // A file under /tmp holding `content`, removed on destruction.
    class TempFile
    {
    public:
        explicit TempFile(const std::string &content)
        {
            char name[] = "/tmp/netscan-test-XXXXXX";
            int fd = mkstemp(name);
            if (fd >= 0)
                close(fd);
            m_path = name;
            std::ofstream out(m_path, std::ios::trunc);
            out << content;
        }

        ~TempFile() { std::remove(m_path.c_str()); }

        TempFile(const TempFile &) = delete;
        TempFile &operator=(const TempFile &) = delete;

        const std::string &Path() const { return m_path; }

    private:
        std::string m_path;
    };
}
