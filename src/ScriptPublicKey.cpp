#include <ScriptPublicKey.h>

#include <tinyformat.h>
#include <utilstrencodings.h>

std::string ScriptPublicKey::ToString() const
{
    return tfm::format("%u:%s", version, HexStr(script));
}
