#include "OutputUtils.h"

namespace spreadrunner
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (traits_type::eq_int_type(c, traits_type::eof()))
        return traits_type::not_eof(c);

    const int r1 = mStreamBuf1->sputc(traits_type::to_char_type(c));
    const int r2 = mStreamBuf2->sputc(traits_type::to_char_type(c));
    return (r1 == traits_type::eof() || r2 == traits_type::eof()) ? traits_type::eof() : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

} // namespace utils
} // namespace spreadrunner
