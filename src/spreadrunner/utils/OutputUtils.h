#pragma once

#include <streambuf>
#include <ostream>

namespace spreadrunner
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream writing to two streams at once, e.g. the console
 * and a log file
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

} // namespace utils
} // namespace spreadrunner
