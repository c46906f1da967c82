#include "ftpcmd/text_codec.hpp"

#include <iconv.h>

#include <cctype>
#include <cerrno>
#include <vector>

#include "ftpcmd/error_codes.hpp"

namespace ftpcmd
{

    namespace
    {

        const iconv_t kInvalidHandle = reinterpret_cast<iconv_t>(-1);

        std::string normalize_name(const std::string &encoding)
        {
            std::string result;
            for (const char ch : encoding)
            {
                if (ch != '-' && ch != '_')
                {
                    result += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                }
            }
            return result;
        }

        std::string convert(iconv_t handle, std::string_view input, const std::string &encoding)
        {
            // Reset shift state left over from a previous call.
            iconv(handle, nullptr, nullptr, nullptr, nullptr);

            std::string output;
            std::vector<char> source(input.begin(), input.end());
            char *in_ptr = source.data();
            std::size_t in_left = source.size();
            std::vector<char> buffer(input.size() * 4 + 16);
            while (in_left > 0)
            {
                char *out_ptr = buffer.data();
                std::size_t out_left = buffer.size();
                const auto rc = iconv(handle, &in_ptr, &in_left, &out_ptr, &out_left);
                output.append(buffer.data(), buffer.size() - out_left);
                if (rc == static_cast<std::size_t>(-1))
                {
                    if (errno == E2BIG)
                    {
                        continue;
                    }
                    throw ProtocolError("cannot convert '" + std::string(input) + "' with encoding " + encoding);
                }
            }
            return output;
        }

    } // namespace

    struct TextCodec::Handles
    {
        iconv_t to_server{kInvalidHandle};
        iconv_t from_server{kInvalidHandle};

        ~Handles()
        {
            if (to_server != kInvalidHandle)
            {
                iconv_close(to_server);
            }
            if (from_server != kInvalidHandle)
            {
                iconv_close(from_server);
            }
        }
    };

    TextCodec::TextCodec(std::string encoding)
        : encoding_(std::move(encoding))
    {
        if (encoding_.empty())
        {
            throw ConnectionError("empty text encoding");
        }
        if (is_utf8())
        {
            return;
        }
        handles_ = std::make_unique<Handles>();
        handles_->to_server = iconv_open(encoding_.c_str(), "UTF-8");
        handles_->from_server = iconv_open("UTF-8", encoding_.c_str());
        if (handles_->to_server == kInvalidHandle || handles_->from_server == kInvalidHandle)
        {
            throw ConnectionError("unsupported text encoding: " + encoding_);
        }
    }

    TextCodec::~TextCodec() = default;
    TextCodec::TextCodec(TextCodec &&) noexcept = default;
    TextCodec &TextCodec::operator=(TextCodec &&) noexcept = default;

    bool TextCodec::is_utf8() const
    {
        const auto name = normalize_name(encoding_);
        return name == "utf8";
    }

    std::string TextCodec::to_server(std::string_view utf8) const
    {
        if (!handles_)
        {
            return std::string(utf8);
        }
        return convert(handles_->to_server, utf8, encoding_);
    }

    std::string TextCodec::from_server(std::string_view raw) const
    {
        if (!handles_)
        {
            return std::string(raw);
        }
        return convert(handles_->from_server, raw, encoding_);
    }

} // namespace ftpcmd
