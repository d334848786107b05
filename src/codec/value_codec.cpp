#include <kvcall/codec/value_decoder.h>
#include <kvcall/codec/value_encoder.h>
#include <kvcall/core/exceptions.h>

#include <fmt/format.h>

namespace kvcall::codec {

void ValueEncoder::throwNoConversion(const char* typeName) {
    throw CodecError(fmt::format("No conversion from '{}' to a wire value", typeName));
}

void ValueEncoder::throwDurationOutOfRange(const char* typeName) {
    throw CodecError(fmt::format("Duration of type '{}' does not fit the 100ns tick range", typeName));
}

void ValueDecoder::throwNoConversion(const char* typeName) {
    throw CodecError(fmt::format("No conversion from text to '{}'", typeName));
}

void ValueDecoder::throwHookTypeMismatch(const char* expected, const char* actual) {
    throw CodecError(
        fmt::format("Deserialize hook returned '{}' where '{}' was requested", actual, expected));
}

} // namespace kvcall::codec
