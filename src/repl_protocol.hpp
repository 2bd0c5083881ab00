// Control bytes, sentinels and statement builders for the MicroPython raw REPL.
// Raw mode framing:
//   host  : <statement bytes> 0x04
//   device: "OK" <stdout> 0x04 <exception text> 0x04 ">"
// Statements are plain Python source; multi-line statements use '\n'.
#pragma once
#include <string>

namespace replcmd
{
const char CTRL_ENTER_RAW = '\x01'; // Ctrl-A
const char CTRL_EXIT_RAW = '\x02';  // Ctrl-B
const char CTRL_INTERRUPT = '\x03'; // Ctrl-C
const char CTRL_EXEC = '\x04';      // Ctrl-D: run statement / soft reset at the friendly prompt

const char *const RAW_BANNER = "raw REPL; CTRL-B to exit\r\n>";
const char *const EXEC_ACK = "OK";
const char *const END_OF_OUTPUT = "\x04";
const char *const END_OF_EXCEPTION = "\x04";
const char *const RAW_PROMPT = ">";

inline std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Single-quoted Python string literal.
inline std::string pyQuote(const std::string &s)
{
    std::string out = "'";
    for (char c : s)
    {
        switch (c)
        {
        case '\\': out += "\\\\"; break;
        case '\'': out += "\\'"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out.push_back(c); break;
        }
    }
    out += "'";
    return out;
}

inline std::string buildOpenForWrite(const std::string &handle, const std::string &path)
{
    return "import ubinascii\n" + handle + " = open(" + pyQuote(path) + ", 'wb')";
}

inline std::string buildWriteChunk(const std::string &handle, const std::string &base64Chunk)
{
    return handle + ".write(ubinascii.a2b_base64('" + base64Chunk + "'))";
}

// Close the handle; when the file was staged under another name, move it
// over the destination. os.sync() is missing on some ports.
inline std::string buildCloseAndCommit(const std::string &handle, const std::string &stagedPath,
                                       const std::string &destPath)
{
    std::string s = handle + ".close()\nimport os\n";
    if (stagedPath != destPath)
        s += "os.rename(" + pyQuote(stagedPath) + ", " + pyQuote(destPath) + ")\n";
    s += "try:\n    os.sync()\nexcept AttributeError:\n    pass";
    return s;
}

inline std::string buildAbortWrite(const std::string &handle, const std::string &stagedPath)
{
    std::string s = "try:\n    " + handle + ".close()\nexcept Exception:\n    pass";
    if (!stagedPath.empty())
        s += "\nimport os\ntry:\n    os.remove(" + pyQuote(stagedPath) + ")\nexcept OSError:\n    pass";
    return s;
}

// "pl:lvl" -> make_key('pl', 'lvl'), "ws" -> 'ws'
inline std::string storeKeyExpr(const std::string &key)
{
    size_t colon = key.find(':');
    if (colon == std::string::npos)
        return pyQuote(key);
    return "make_key(" + pyQuote(key.substr(0, colon)) + ", " + pyQuote(key.substr(colon + 1)) + ")";
}

enum class StoreRead
{
    Int32,
    String,
    ElementCount // comma-separated entries in a string value
};

inline std::string buildStoreRead(const std::string &storeModule, const std::string &ns,
                                  const std::string &key, StoreRead how)
{
    std::string k = storeKeyExpr(key);
    std::string get;
    switch (how)
    {
    case StoreRead::Int32:
        get = "print(prefs.get_int32(" + k + ", -1))";
        break;
    case StoreRead::String:
        get = "print(prefs.get_string(" + k + ", ''))";
        break;
    case StoreRead::ElementCount:
        get = "v = prefs.get_string(" + k + ", '')\n    print(len(v.split(',')) if v else 0)";
        break;
    }
    return "from " + storeModule + " import prefs, make_key\n"
           "prefs.begin(" + pyQuote(ns) + ", False, context='verify')\n"
           "try:\n    " + get + "\nfinally:\n    prefs.end()";
}

inline std::string buildReadFile(const std::string &path)
{
    return "with open(" + pyQuote(path) + ") as f:\n    print(f.read())";
}
} // namespace replcmd
