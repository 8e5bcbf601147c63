#ifndef STREAM_NAME_HPP
#define STREAM_NAME_HPP

#include <string>
#include <vector>

/**
 * @brief Map a video filename to its stream identifier
 *
 * Directory components and the extension are dropped, the rest is
 * lowercased and restricted to [a-z0-9_-]. Never returns an empty string:
 * names with nothing usable left map to "stream-" plus a short SHA-1 of the
 * base filename.
 *
 * @code
 * sanitize_stream_name("My Video (1080p).mp4");   // "my_video_1080p"
 * sanitize_stream_name("/videos/test-stream.mkv"); // "test-stream"
 * @endcode
 */
std::string sanitize_stream_name(const std::string &filename);

/** Last path component of @p path */
std::string base_filename(const std::string &path);

/** Lowercased extension including the dot, or "" when there is none */
std::string file_extension(const std::string &filename);

bool is_hidden_file(const std::string &filename);

/**
 * @brief Whether @p filename is a non-hidden file whose extension is
 * listed in @p extensions (compared case-insensitively)
 */
bool is_video_file(const std::string &filename,
                   const std::vector<std::string> &extensions);

#endif // STREAM_NAME_HPP
