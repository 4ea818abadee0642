#ifndef SCRIPT_PUBLIC_KEY_H
#define SCRIPT_PUBLIC_KEY_H
#include <stdint.h>
#include <string>
#include <vector>

/** A versioned locking script */
class ScriptPublicKey
{
public:
    uint16_t version;
    std::vector<unsigned char> script;

    ScriptPublicKey(
        ): version(0)
        , script()
    {
    }
    ScriptPublicKey(
        uint16_t versionIn,
        const std::vector<unsigned char>& scriptIn
        ): version(versionIn)
        , script(scriptIn)
    {
    }

    friend bool operator==(const ScriptPublicKey& a, const ScriptPublicKey& b)
    {
        return a.version == b.version && a.script == b.script;
    }
    friend bool operator!=(const ScriptPublicKey& a, const ScriptPublicKey& b)
    {
        return !(a == b);
    }
    std::string ToString() const;
};
#endif// SCRIPT_PUBLIC_KEY_H
