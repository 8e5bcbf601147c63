#include "stream_name.hpp"

#include <algorithm>
#include <cctype>

#include <glib.h>

namespace
{
    constexpr const char *PLACEHOLDER_PREFIX = "stream-";
    constexpr size_t PLACEHOLDER_HASH_LEN = 8;

    std::string to_lower_ascii(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string strip_extension(const std::string &name)
    {
        size_t dot = name.find_last_of('.');
        if (dot == std::string::npos || dot == 0)
            return name;
        return name.substr(0, dot);
    }

    bool is_allowed(unsigned char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    }

    std::string placeholder_for(const std::string &name)
    {
        gchar *digest = g_compute_checksum_for_string(G_CHECKSUM_SHA1, name.c_str(),
                                                      static_cast<gssize>(name.size()));
        std::string hex = digest ? digest : "";
        g_free(digest);

        return PLACEHOLDER_PREFIX + hex.substr(0, PLACEHOLDER_HASH_LEN);
    }
}

std::string base_filename(const std::string &path)
{
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos)
        return "";

    size_t slash = path.find_last_of('/', end);
    size_t begin = (slash == std::string::npos) ? 0 : slash + 1;
    return path.substr(begin, end - begin + 1);
}

std::string file_extension(const std::string &filename)
{
    std::string name = base_filename(filename);
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return "";
    return to_lower_ascii(name.substr(dot));
}

bool is_hidden_file(const std::string &filename)
{
    std::string name = base_filename(filename);
    return !name.empty() && name[0] == '.';
}

bool is_video_file(const std::string &filename,
                   const std::vector<std::string> &extensions)
{
    if (is_hidden_file(filename))
        return false;

    std::string ext = file_extension(filename);
    if (ext.empty())
        return false;

    for (const auto &candidate : extensions)
    {
        if (to_lower_ascii(candidate) == ext)
            return true;
    }
    return false;
}

std::string sanitize_stream_name(const std::string &filename)
{
    const std::string name = base_filename(filename);
    const std::string stem = to_lower_ascii(strip_extension(name));

    std::string id;
    id.reserve(stem.size());

    for (unsigned char c : stem)
    {
        char out = is_allowed(c) ? static_cast<char>(c) : '_';

        // "__" -> "_" and "--" -> "-"; mixed runs like "_-_" are kept
        if ((out == '_' || out == '-') && !id.empty() && id.back() == out)
            continue;
        id.push_back(out);
    }

    size_t first = id.find_first_not_of("_-");
    if (first == std::string::npos)
        return placeholder_for(name);

    size_t last = id.find_last_not_of("_-");
    return id.substr(first, last - first + 1);
}
