#include "reassembler.hpp"
#include "slicer.hpp"
#include "fountain_errors.hpp"

std::vector<uint8_t> finish_message(const PeelingDecoder& decoder, std::size_t original_byte_length) {
    if (!decoder.solved()) throw DecodeIncomplete();
    return reassemble_message(decoder.chunks(), original_byte_length);
}
