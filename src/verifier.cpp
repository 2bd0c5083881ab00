#include "verifier.hpp"
#include "repl_protocol.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

using replcmd::trim;

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static bool parseInteger(const std::string &text, long long &out)
{
    std::string t = trim(text);
    if (t.empty())
        return false;
    char *end = nullptr;
    errno = 0;
    out = std::strtoll(t.c_str(), &end, 10);
    return errno == 0 && end != nullptr && *end == '\0';
}

static ValueKind kindFromName(const std::string &name, const std::string &where)
{
    std::string n = lower(name);
    if (n == "int" || n == "int32") return ValueKind::Integer;
    if (n == "str" || n == "string") return ValueKind::Text;
    if (n == "count") return ValueKind::Count;
    throw std::runtime_error(where + ": unknown type '" + name + "' (int, str, count)");
}

VerificationSpec loadVerificationSpec(const std::string &path)
{
    VerificationSpec spec;
    try
    {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened())
            throw std::runtime_error("cannot open verification spec " + path);

        cv::FileNode checks = fs["checks"];
        if (checks.empty() || !checks.isSeq())
            throw std::runtime_error(path + ": 'checks' must be a sequence");

        int index = 0;
        for (cv::FileNodeIterator it = checks.begin(); it != checks.end(); ++it, ++index)
        {
            cv::FileNode node = *it;
            std::string where = path + " checks[" + std::to_string(index) + "]";
            Expectation e;
            node["namespace"] >> e.ns;
            node["key"] >> e.key;
            if (e.ns.empty() || e.key.empty())
                throw std::runtime_error(where + ": namespace and key are required");

            cv::FileNode expected = node["expected"];
            if (expected.isInt())
            {
                e.expected = std::to_string(static_cast<int>(expected));
                e.kind = ValueKind::Integer;
            }
            else if (expected.isString())
            {
                e.expected = static_cast<std::string>(expected);
                e.kind = ValueKind::Text;
            }
            else
            {
                throw std::runtime_error(where + ": expected must be an integer or a string");
            }
            if (!node["type"].empty())
                e.kind = kindFromName(static_cast<std::string>(node["type"]), where);
            spec.checks.push_back(e);
        }
    }
    catch (const cv::Exception &ex)
    {
        throw std::runtime_error("cannot parse verification spec " + path + ": " + ex.what());
    }
    return spec;
}

bool valuesMatch(const Expectation &e, const std::string &actual)
{
    if (e.kind == ValueKind::Text)
        return actual == e.expected;
    long long want = 0, got = 0;
    if (!parseInteger(e.expected, want) || !parseInteger(actual, got))
        return false;
    return want == got;
}

VerificationDriver::VerificationDriver(RawReplController &repl, const std::string &storeModule,
                                       const std::string &patchLogPath)
    : repl_(repl), storeModule_(storeModule), patchLogPath_(patchLogPath) {}

VerificationReport VerificationDriver::verify(const VerificationSpec &spec)
{
    // a reboot always puts the app back in charge
    repl_.interrupt();
    repl_.enterRawMode();

    VerificationReport report;
    std::vector<Mismatch> mismatches;

    if (!patchLogPath_.empty())
        checkPatchLog(report, mismatches);

    for (const auto &e : spec.checks)
    {
        replcmd::StoreRead how = replcmd::StoreRead::Int32;
        if (e.kind == ValueKind::Text) how = replcmd::StoreRead::String;
        else if (e.kind == ValueKind::Count) how = replcmd::StoreRead::ElementCount;

        std::string actual;
        try
        {
            std::string out = repl_.execute(replcmd::buildStoreRead(storeModule_, e.ns, e.key, how));
            // print() ends with \r\n; strings keep their inner whitespace
            while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
                out.pop_back();
            actual = out;
        }
        catch (const DeviceExecutionError &ex)
        {
            std::string text = trim(ex.text());
            size_t nl = text.rfind('\n');
            actual = "<error: " + (nl == std::string::npos ? text : trim(text.substr(nl + 1))) + ">";
        }
        ++report.checked;
        if (!valuesMatch(e, actual))
            mismatches.push_back({e.ns, e.key, e.expected, actual});
        else
            CV_LOG_INFO(NULL, e.ns << "/" << e.key << " = " << actual);
    }

    if (!mismatches.empty())
        throw VerificationFailed(mismatches);

    repl_.exitRawMode();
    return report;
}

// The payload logs "<step> ok" / "<step> err: ..." lines to its log file.
void VerificationDriver::checkPatchLog(VerificationReport &report, std::vector<Mismatch> &mismatches)
{
    try
    {
        report.patchLog = trim(repl_.execute(replcmd::buildReadFile(patchLogPath_)));
    }
    catch (const DeviceExecutionError &)
    {
        mismatches.push_back({"file", patchLogPath_, "present", "<missing>"});
        return;
    }

    std::istringstream lines(report.patchLog);
    std::string line;
    while (std::getline(lines, line))
    {
        if (lower(line).find("err") != std::string::npos)
        {
            mismatches.push_back({"file", patchLogPath_, "no errors", trim(line)});
            return;
        }
    }
}
