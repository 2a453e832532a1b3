/* Copyright 2026, Roomcast contributors. All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace roomcast
{
namespace xml
{

// Tag-level scanning of the small XML documents speakers exchange. This is
// not a validating parser: it finds elements by local name, ignoring
// namespace prefixes, and leaves everything it does not understand alone.

inline std::string escape(const std::string& text)
{
  std::string result;
  result.reserve(text.size());
  for (const auto c : text)
  {
    switch (c)
    {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '"':
      result += "&quot;";
      break;
    case '\'':
      result += "&apos;";
      break;
    default:
      result += c;
    }
  }
  return result;
}

namespace detail
{

inline void replaceAll(std::string& text, const std::string& from, const std::string& to)
{
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos)
  {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

inline void appendUtf8(std::string& out, const std::uint32_t codePoint)
{
  if (codePoint < 0x80)
  {
    out += static_cast<char>(codePoint);
  }
  else if (codePoint < 0x800)
  {
    out += static_cast<char>(0xC0 | (codePoint >> 6));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
  else if (codePoint < 0x10000)
  {
    out += static_cast<char>(0xE0 | (codePoint >> 12));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
  else if (codePoint < 0x110000)
  {
    out += static_cast<char>(0xF0 | (codePoint >> 18));
    out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
}

// Decodes &#NN; and &#xHH; references, leaving malformed ones as they are
inline std::string decodeNumericReferences(const std::string& text)
{
  std::string result;
  result.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size())
  {
    const auto ref = text.find("&#", pos);
    if (ref == std::string::npos)
    {
      break;
    }
    const auto semi = text.find(';', ref);
    const auto isHex = ref + 2 < text.size() && (text[ref + 2] == 'x' || text[ref + 2] == 'X');
    const auto digitsBegin = ref + (isHex ? 3 : 2);
    result.append(text, pos, ref - pos);
    if (semi == std::string::npos || semi == digitsBegin || semi - digitsBegin > 8)
    {
      result += "&#";
      pos = ref + 2;
      continue;
    }
    const auto digits = text.substr(digitsBegin, semi - digitsBegin);
    char* pEnd = nullptr;
    const auto value = std::strtoul(digits.c_str(), &pEnd, isHex ? 16 : 10);
    if (pEnd == nullptr || *pEnd != '\0')
    {
      result += "&#";
      pos = ref + 2;
      continue;
    }
    appendUtf8(result, static_cast<std::uint32_t>(value));
    pos = semi + 1;
  }
  result.append(text, pos, std::string::npos);
  return result;
}

inline bool isNameChar(const char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '-'
         || c == '.';
}

inline std::string localName(const std::string& qualifiedName)
{
  const auto colon = qualifiedName.find(':');
  return colon == std::string::npos ? qualifiedName : qualifiedName.substr(colon + 1);
}

struct Tag
{
  std::size_t begin;
  std::size_t end; // one past '>'
  std::string qualifiedName;
  bool closing;
  bool selfClosing;
};

// Finds the next start or end tag at or after 'from'. Comments, processing
// instructions, declarations and CDATA sections are skipped.
inline std::optional<Tag> nextTag(const std::string& doc, std::size_t from)
{
  while (true)
  {
    const auto lt = doc.find('<', from);
    if (lt == std::string::npos || lt + 1 >= doc.size())
    {
      return std::nullopt;
    }

    if (doc.compare(lt, 4, "<!--") == 0)
    {
      const auto close = doc.find("-->", lt + 4);
      if (close == std::string::npos)
      {
        return std::nullopt;
      }
      from = close + 3;
      continue;
    }
    if (doc.compare(lt, 9, "<![CDATA[") == 0)
    {
      const auto close = doc.find("]]>", lt + 9);
      if (close == std::string::npos)
      {
        return std::nullopt;
      }
      from = close + 3;
      continue;
    }
    if (doc[lt + 1] == '?' || doc[lt + 1] == '!')
    {
      const auto close = doc.find('>', lt + 1);
      if (close == std::string::npos)
      {
        return std::nullopt;
      }
      from = close + 1;
      continue;
    }

    const auto closing = doc[lt + 1] == '/';
    auto nameEnd = lt + (closing ? 2 : 1);
    const auto nameBegin = nameEnd;
    while (nameEnd < doc.size() && isNameChar(doc[nameEnd]))
    {
      ++nameEnd;
    }
    if (nameEnd == nameBegin)
    {
      from = lt + 1;
      continue;
    }

    // Find the end of the tag, ignoring '>' inside quoted attribute values
    auto pos = nameEnd;
    char quote = '\0';
    while (pos < doc.size() && (quote != '\0' || doc[pos] != '>'))
    {
      if (quote != '\0' && doc[pos] == quote)
      {
        quote = '\0';
      }
      else if (quote == '\0' && (doc[pos] == '"' || doc[pos] == '\''))
      {
        quote = doc[pos];
      }
      ++pos;
    }
    if (pos >= doc.size())
    {
      return std::nullopt;
    }

    const auto selfClosing = !closing && pos > nameEnd && doc[pos - 1] == '/';
    return Tag{lt, pos + 1, doc.substr(nameBegin, nameEnd - nameBegin), closing,
               selfClosing};
  }
}

inline std::optional<Tag> findStartTag(const std::string& doc,
                                       const std::string& name,
                                       std::size_t from)
{
  while (auto tag = nextTag(doc, from))
  {
    if (!tag->closing && localName(tag->qualifiedName) == name)
    {
      return tag;
    }
    from = tag->end;
  }
  return std::nullopt;
}

} // namespace detail

// Decodes the five predefined entities and numeric character references.
// &amp; is decoded last so that "&amp;lt;" yields "&lt;" and not "<".
inline std::string unescape(const std::string& text)
{
  if (text.find('&') == std::string::npos)
  {
    return text;
  }
  auto result = detail::decodeNumericReferences(text);
  detail::replaceAll(result, "&lt;", "<");
  detail::replaceAll(result, "&gt;", ">");
  detail::replaceAll(result, "&quot;", "\"");
  detail::replaceAll(result, "&apos;", "'");
  detail::replaceAll(result, "&amp;", "&");
  return result;
}

using Attributes = std::vector<std::pair<std::string, std::string>>;

// Parses name="value" and name='value' pairs of a start tag. Values are
// unescaped.
inline Attributes parseAttributes(const std::string& tagText)
{
  Attributes result;
  std::size_t pos = 0;
  // Skip '<' and the element name
  while (pos < tagText.size() && (tagText[pos] == '<' || detail::isNameChar(tagText[pos])))
  {
    ++pos;
  }
  while (pos < tagText.size())
  {
    while (pos < tagText.size() && !detail::isNameChar(tagText[pos]))
    {
      ++pos;
    }
    const auto nameBegin = pos;
    while (pos < tagText.size() && detail::isNameChar(tagText[pos]))
    {
      ++pos;
    }
    if (pos == nameBegin)
    {
      break;
    }
    auto name = tagText.substr(nameBegin, pos - nameBegin);
    while (pos < tagText.size() && std::isspace(static_cast<unsigned char>(tagText[pos])))
    {
      ++pos;
    }
    if (pos >= tagText.size() || tagText[pos] != '=')
    {
      continue;
    }
    ++pos;
    while (pos < tagText.size() && std::isspace(static_cast<unsigned char>(tagText[pos])))
    {
      ++pos;
    }
    if (pos >= tagText.size() || (tagText[pos] != '"' && tagText[pos] != '\''))
    {
      continue;
    }
    const auto quote = tagText[pos++];
    const auto valueEnd = tagText.find(quote, pos);
    if (valueEnd == std::string::npos)
    {
      break;
    }
    result.emplace_back(std::move(name), unescape(tagText.substr(pos, valueEnd - pos)));
    pos = valueEnd + 1;
  }
  return result;
}

struct Element
{
  std::string name;
  Attributes attributes;
  std::string content;
  // True if an element with the same local name is nested inside
  bool nested = false;

  std::optional<std::string> attribute(const std::string& attributeName) const
  {
    for (const auto& attr : attributes)
    {
      if (attr.first == attributeName)
      {
        return attr.second;
      }
    }
    return std::nullopt;
  }
};

// Raw content of the first element with the given local name. The content
// ends at the first matching end tag, so for nested elements of the same
// name the outer start is paired with the inner end. A self-closing element
// yields an empty string. The content is not unescaped.
inline std::optional<std::string> elementText(const std::string& doc,
                                              const std::string& name)
{
  const auto start = detail::findStartTag(doc, name, 0);
  if (!start)
  {
    return std::nullopt;
  }
  if (start->selfClosing)
  {
    return std::string{};
  }

  auto from = start->end;
  while (auto tag = detail::nextTag(doc, from))
  {
    if (tag->closing && detail::localName(tag->qualifiedName) == name)
    {
      return doc.substr(start->end, tag->begin - start->end);
    }
    from = tag->end;
  }
  return std::nullopt;
}

// Value of the given attribute on the first element with the given local name
inline std::optional<std::string> attribute(const std::string& doc,
                                            const std::string& elementName,
                                            const std::string& attributeName)
{
  const auto start = detail::findStartTag(doc, elementName, 0);
  if (!start)
  {
    return std::nullopt;
  }
  for (auto& attr : parseAttributes(doc.substr(start->begin, start->end - start->begin)))
  {
    if (attr.first == attributeName)
    {
      return std::move(attr.second);
    }
  }
  return std::nullopt;
}

// All outermost elements with the given local name, in document order. An
// element whose end tag is missing is not reported.
inline std::vector<Element> elements(const std::string& doc, const std::string& name)
{
  std::vector<Element> result;
  std::size_t from = 0;
  while (auto start = detail::findStartTag(doc, name, from))
  {
    Element element;
    element.name = start->qualifiedName;
    element.attributes =
      parseAttributes(doc.substr(start->begin, start->end - start->begin));

    if (start->selfClosing)
    {
      from = start->end;
      result.push_back(std::move(element));
      continue;
    }

    std::size_t depth = 1;
    auto pos = start->end;
    std::optional<detail::Tag> end;
    while (auto tag = detail::nextTag(doc, pos))
    {
      pos = tag->end;
      if (detail::localName(tag->qualifiedName) != name || tag->selfClosing)
      {
        element.nested = element.nested || (!tag->closing && tag->selfClosing
                                            && detail::localName(tag->qualifiedName) == name);
        continue;
      }
      if (tag->closing)
      {
        if (--depth == 0)
        {
          end = tag;
          break;
        }
      }
      else
      {
        ++depth;
        element.nested = true;
      }
    }

    if (!end)
    {
      break;
    }
    element.content = doc.substr(start->end, end->begin - start->end);
    result.push_back(std::move(element));
    from = end->end;
  }
  return result;
}

} // namespace xml
} // namespace roomcast
