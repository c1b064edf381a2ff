// SPDX-License-Identifier: Apache-2.0
#include "CodeExtractor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>
#include <string>
#include <utility>

namespace apkforge
{

namespace
{
    struct CodeBlock
    {
        std::string tag;
        std::string body;
    };

    struct FenceExtension
    {
        std::string_view tag;
        std::string_view extension;
    };

    constexpr auto FenceExtensions = std::array {
        FenceExtension { "kotlin", "kt" },   FenceExtension { "kt", "kt" },
        FenceExtension { "java", "java" },   FenceExtension { "xml", "xml" },
        FenceExtension { "groovy", "gradle" }, FenceExtension { "gradle", "gradle" },
        FenceExtension { "kts", "kts" },     FenceExtension { "json", "json" },
        FenceExtension { "properties", "properties" },
    };

    auto trimView(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    auto lowerCase(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /// Returns the fenced blocks in order; an unterminated final block runs to the end of the text.
    auto splitFencedBlocks(std::string_view text) -> std::vector<CodeBlock>
    {
        auto blocks = std::vector<CodeBlock> {};
        auto current = std::optional<CodeBlock> {};

        auto pos = std::size_t { 0 };
        while (pos <= text.size())
        {
            auto const nl = text.find('\n', pos);
            auto const line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
            auto const trimmed = trimView(line);

            if (trimmed.starts_with("```"))
            {
                if (current)
                {
                    blocks.push_back(std::move(*current));
                    current.reset();
                }
                else
                {
                    current = CodeBlock { .tag = lowerCase(trimView(trimmed.substr(3))), .body = {} };
                }
            }
            else if (current)
            {
                current->body += line;
                current->body += '\n';
            }

            if (nl == std::string_view::npos)
                break;
            pos = nl + 1;
        }

        if (current)
            blocks.push_back(std::move(*current));
        return blocks;
    }

    auto extensionFor(std::string_view tag, SourceLanguage language) -> std::string_view
    {
        for (const auto& entry: FenceExtensions)
        {
            if (entry.tag == tag)
                return entry.extension;
        }
        return sourceExtension(language);
    }

    /// Recognizes "// File: x", "# File: x" and "<!-- File: x -->".
    auto parseFileHeader(std::string_view line) -> std::optional<std::string>
    {
        auto text = trimView(line);
        if (text.starts_with("//"))
            text = trimView(text.substr(2));
        else if (text.starts_with("#"))
            text = trimView(text.substr(1));
        else if (text.starts_with("<!--"))
        {
            text = trimView(text.substr(4));
            if (text.ends_with("-->"))
                text = trimView(text.substr(0, text.size() - 3));
        }
        else
            return std::nullopt;

        auto const lower = lowerCase(text.substr(0, std::min<std::size_t>(text.size(), 5)));
        if (lower != "file:")
            return std::nullopt;

        auto path = trimView(text.substr(5));
        if (path.empty())
            return std::nullopt;
        return std::string(path);
    }

    /// Splits off a leading file header; returns the header path and the remaining body.
    auto takeFileHeader(std::string_view body) -> std::pair<std::optional<std::string>, std::string_view>
    {
        auto pos = std::size_t { 0 };
        while (pos < body.size())
        {
            auto const nl = body.find('\n', pos);
            auto const end = nl == std::string_view::npos ? body.size() : nl;
            auto const line = body.substr(pos, end - pos);
            if (!trimView(line).empty())
            {
                auto header = parseFileHeader(line);
                if (!header)
                    return { std::nullopt, body };
                return { std::move(header), nl == std::string_view::npos ? std::string_view {} : body.substr(nl + 1) };
            }
            if (nl == std::string_view::npos)
                break;
            pos = nl + 1;
        }
        return { std::nullopt, body };
    }

    auto unnamedFileName(int index, std::string_view extension) -> std::string
    {
        if (index == 1)
            return std::format("{}.{}", UnnamedCodeBaseName, extension);
        return std::format("{}{}.{}", UnnamedCodeBaseName, index, extension);
    }

    void addOrReplace(std::vector<GeneratedFile>& files, GeneratedFile file)
    {
        auto const existing =
            std::ranges::find_if(files, [&](const GeneratedFile& f) { return f.relativePath == file.relativePath; });
        if (existing != files.end())
            *existing = std::move(file);
        else
            files.push_back(std::move(file));
    }
} // namespace

auto extractCodeFiles(std::string_view completion, SourceLanguage language) -> std::vector<GeneratedFile>
{
    auto files = std::vector<GeneratedFile> {};
    auto const blocks = splitFencedBlocks(completion);

    if (blocks.empty())
    {
        auto contents = std::string(trimView(completion));
        if (!contents.empty())
            contents += '\n';
        files.push_back(GeneratedFile { .relativePath = unnamedFileName(1, sourceExtension(language)),
                                        .contents = std::move(contents) });
        return files;
    }

    auto unnamedCount = 0;
    for (const auto& block: blocks)
    {
        auto [header, body] = takeFileHeader(block.body);
        auto path = header ? std::move(*header) : unnamedFileName(++unnamedCount, extensionFor(block.tag, language));
        addOrReplace(files, GeneratedFile { .relativePath = std::move(path), .contents = std::string(body) });
    }
    return files;
}

} // namespace apkforge
