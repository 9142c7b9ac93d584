#include "jframepp/Peer.hpp"

using namespace jframepp;

std::string Peer::toString() const
{
    if (host.find(':') != std::string::npos)
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

std::ostream& jframepp::operator<<(std::ostream& os, const Peer& peer)
{
    return os << peer.toString();
}
