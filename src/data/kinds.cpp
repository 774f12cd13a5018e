#include "nostd/data/data.hpp"

using namespace nostd::data;

KindClass nostd::data::classifyKind(Kind kind)
{
    switch (kind)
    {
    case kinds::SHORT_NOTE:
        return KindClass::ShortNote;
    case kinds::DIRECT_MESSAGE:
        return KindClass::DirectMessage;
    case kinds::IOT:
        return KindClass::Iot;
    case kinds::AUTH:
        return KindClass::Auth;
    default:
        break;
    }

    if (kind >= 1000 && kind < 10000)
    {
        return KindClass::Regular;
    }
    if (kind >= 10000 && kind < 20000)
    {
        return KindClass::Replaceable;
    }
    if (kind >= 20000 && kind < 30000)
    {
        return KindClass::Ephemeral;
    }
    if (kind >= 30000 && kind < 40000)
    {
        return KindClass::ParameterizedReplaceable;
    }

    return KindClass::Custom;
};
