#include "Diagnostics.hpp"

#include <algorithm>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::preview_bytes_{ 80 };

void Diagnostics::Configure(const TraceSettings& settings) noexcept
{
    verbose_.store(settings.verbose, std::memory_order_relaxed);
    preview_bytes_.store(std::max<std::size_t>(settings.preview_bytes, 1), std::memory_order_relaxed);
}

TraceSettings Diagnostics::Current() noexcept
{
    TraceSettings settings;
    settings.verbose = verbose_.load(std::memory_order_relaxed);
    settings.preview_bytes = preview_bytes_.load(std::memory_order_relaxed);
    return settings;
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = std::min(text.size(), preview_bytes_.load(std::memory_order_relaxed));

    // Back up to a lead byte so a multi-byte form is never split.
    while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;

    std::string out;
    out.reserve(cut + 16);
    for (char ch : text.substr(0, cut))
    {
        if (ch == '\n')
            out += "\\n";
        else if (ch == '\r')
            out += "\\r";
        else if (ch == '\t')
            out += "\\t";
        else
            out.push_back(ch);
    }
    maskControlBytes(out);

    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

void Diagnostics::maskControlBytes(std::string& text)
{
    std::replace_if(text.begin(), text.end(), [](unsigned char c) { return c < 0x20; }, '?');
}

} // namespace processing
