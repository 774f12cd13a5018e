#pragma once

#include <stdexcept>
#include <string>

namespace nostd
{
/**
 * @brief Base class of every error raised by the library.
 * @remark None of these errors is transient.  Each one reports a violated precondition (size,
 * ordering, key validity, or input integrity), so the library never retries and callers decide
 * how to recover.
 */
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A tag, content, or filter bound was exceeded.
 * @remark Raised before any cryptographic work is done.  Retrying with a smaller payload is the
 * only way to recover.
 */
class CapacityError : public Error
{
public:
    explicit CapacityError(const std::string& message) : Error(message) {}
};

/**
 * @brief A NIP-04 plaintext exceeds the configured message bound.
 */
class LengthError : public CapacityError
{
public:
    explicit LengthError(const std::string& message) : CapacityError(message) {}
};

/**
 * @brief An output buffer is too small to hold the full result.
 * @remark Output is never truncated.  The caller must retry with a larger buffer.
 */
class BufferTooSmall : public Error
{
public:
    BufferTooSmall(const std::string& message, std::size_t required)
        : Error(message), _required(required) {}

    /**
     * @brief The number of bytes written before the buffer ran out, plus the bytes that did not
     * fit in the write that failed.  This is a lower bound on the capacity needed.
     */
    std::size_t required() const { return _required; }

private:
    std::size_t _required;
};

/**
 * @brief Key material is malformed or not a valid secp256k1 key.
 */
class KeyError : public Error
{
public:
    explicit KeyError(const std::string& message) : Error(message) {}
};

/**
 * @brief An event builder was driven out of order, or an unfinished event was used where a
 * signed one is required.
 */
class SequenceError : public Error
{
public:
    explicit SequenceError(const std::string& message) : Error(message) {}
};

/**
 * @brief A NIP-04 payload could not be decoded or decrypted.
 * @remark Callers should treat every `CodecError` as a single opaque failure.
 */
class CodecError : public Error
{
public:
    explicit CodecError(const std::string& message) : Error(message) {}
};

/**
 * @brief A NIP-04 wire string is structurally malformed (missing delimiter, bad base64, wrong
 * IV or block length).
 */
class EncodingError : public CodecError
{
public:
    explicit EncodingError(const std::string& message) : CodecError(message) {}
};

/**
 * @brief The PKCS#7 padding of a decrypted NIP-04 payload is inconsistent.
 */
class PaddingError : public CodecError
{
public:
    explicit PaddingError(const std::string& message) : CodecError(message) {}
};
} // namespace nostd
