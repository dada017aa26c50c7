#include "beamproto/history.hpp"

namespace BeamProto {

const char* to_string(Direction direction) {
    return direction == Direction::SEND ? "send" : "receive";
}

} // namespace BeamProto
