#include "sys_util.h"
#include <glob.h>
#include <sys/stat.h>
#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

std::string read_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return std::string();
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

std::string read_line(const std::string &path)
{
    std::ifstream f(path);
    std::string line;
    if (!f.is_open() || !std::getline(f, line))
        return std::string();
    return trim(line);
}

bool path_exists(const std::string &path)
{
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

std::vector<std::string> glob_paths(const std::string &pattern)
{
    std::vector<std::string> out;
    glob_t g{};
    if (::glob(pattern.c_str(), 0, nullptr, &g) == 0)
    {
        for (std::size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    ::globfree(&g);
    return out;
}

std::string run_command(const std::string &cmd, double timeout_s)
{
    std::ostringstream full;
    full << "timeout " << timeout_s << " " << cmd << " 2>/dev/null";

    FILE *p = ::popen(full.str().c_str(), "r");
    if (!p)
        return std::string();

    std::string out;
    std::array<char, 512> buf;
    std::size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), p)) > 0)
        out.append(buf.data(), n);

    int status = ::pclose(p);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
        return std::string();
    return out;
}

std::string trim(const std::string &s)
{
    const char *ws = " \t\r\n";
    std::size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return std::string();
    std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool parse_int(const std::string &s, long long &out)
{
    std::string t = trim(s);
    if (t.empty())
        return false;
    char *end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (end == t.c_str())
        return false;
    out = v;
    return true;
}
