#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace plrank
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to send the rating report and the verbose fit diagnostics to the
 * console and to a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    /**
     * @brief Construct a TeeBuf with two target stream buffers
     * @param sb1 First stream buffer to write to
     * @param sb2 Second stream buffer to write to
     */
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Handle character overflow by writing to both buffers
     * @param c Character to write
     * @return EOF on error, otherwise the character written
     */
    int overflow(int c) override;

    /**
     * @brief Synchronize both underlying buffers
     * @return 0 on success, -1 on error
     */
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Default log file name for a results file: "<stem>_ratings_<timestamp>.log"
 * @param resultsFileName Contest results file being rated
 */
std::string createRatingLogFileName(const std::string& resultsFileName);

} // namespace utils
} // namespace plrank
