#include "readData.h"
#include "bpp/Structs/errors.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bpp {

namespace {
// the parser never scales by more than 10^6
constexpr int maxScale = 6;

bool isNumeric(const Parser::Token &token)
{
    return Parser::decimalPlaces(token.text).has_value();
}

// non negative integer that fits an int, counts and opt are never scaled
int parseCount(const Parser::Token &token, const std::string &what)
{
    const auto places = Parser::decimalPlaces(token.text);
    if (!places || *places != 0 || token.text[0] == '-' || token.text.size() > 9)
    {
        throw MalformedInputError(token.line, "expected an integer " + what + ", got '" + token.text + "'");
    }
    return std::stoi(token.text);
}
}

std::vector<Instance> Parser::readInstances(const std::string &filename)
{
    std::ifstream infile(filename);
    if (!infile)
    {
        throw std::runtime_error("Unable to open file " + filename);
    }
    std::ostringstream content;
    content << infile.rdbuf();
    if (infile.bad())
    {
        throw std::runtime_error("Unable to read file " + filename);
    }
    std::string stem = std::filesystem::path(filename).stem().string();
    if (stem.empty())
        stem = "dataset";
    return parse(content.str(), stem);
}

std::vector<Instance> Parser::parse(const std::string &content, const std::string &stem)
{
    std::vector<std::vector<Token>> lines;
    std::istringstream input(content);
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line))
    {
        lineNumber++;
        std::istringstream iss(line);
        std::vector<Token> tokens;
        std::string text;
        while (iss >> text)
        {
            // full line comments only
            if (tokens.empty() && text[0] == '#')
                break;
            tokens.push_back({text, lineNumber});
        }
        if (!tokens.empty())
            lines.push_back(std::move(tokens));
    }
    if (lines.empty())
    {
        throw EmptyInputError("no instance data in '" + stem + "'");
    }

    std::vector<Token> tokens;
    for (const auto &tokensOfLine : lines)
        tokens.insert(tokens.end(), tokensOfLine.begin(), tokensOfLine.end());

    if (std::all_of(tokens.begin(), tokens.end(), isNumeric))
    {
        return parseSimple(tokens, stem);
    }
    const auto firstPlaces = decimalPlaces(tokens[0].text);
    if (tokens.size() >= 2 && firstPlaces && *firstPlaces == 0 && !isNumeric(tokens[1]))
    {
        return parseBinPack(lines, stem);
    }
    auto offending = std::find_if_not(tokens.begin(), tokens.end(), isNumeric);
    throw MalformedInputError(offending->line, "unrecognized format, unexpected token '" + offending->text + "'");
}

std::optional<int> Parser::decimalPlaces(const std::string &token)
{
    std::size_t i = token.size() > 0 && token[0] == '-' ? 1 : 0;
    const std::size_t intBegin = i;
    while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i])))
        i++;
    if (i == intBegin)
        return std::nullopt;
    if (i == token.size())
        return 0;
    if (token[i] != '.')
        return std::nullopt;
    const std::size_t fracBegin = ++i;
    while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i])))
        i++;
    if (i == fracBegin || i != token.size())
        return std::nullopt;
    return static_cast<int>(i - fracBegin);
}

int Parser::detectScale(const std::vector<Token> &tokens)
{
    int scale = 0;
    for (const auto &token : tokens)
    {
        const auto places = decimalPlaces(token.text);
        if (!places)
        {
            throw MalformedInputError(token.line, "non-numeric token '" + token.text + "'");
        }
        if (*places > maxScale)
        {
            throw MalformedInputError(token.line, "too many decimals in '" + token.text + "' (at most " +
                                                      std::to_string(maxScale) + " supported)");
        }
        scale = std::max(scale, *places);
    }
    return scale;
}

int Parser::scaleToken(const Token &token, int scale)
{
    const auto places = decimalPlaces(token.text);
    if (!places)
    {
        throw MalformedInputError(token.line, "non-numeric token '" + token.text + "'");
    }
    if (token.text[0] == '-')
    {
        throw MalformedInputError(token.line, "negative value not allowed: " + token.text);
    }
    if (*places > scale)
    {
        throw MalformedInputError(token.line, "too many decimals in '" + token.text + "' for scale " +
                                                  std::to_string(scale));
    }
    // shift the decimal point instead of going through a double
    std::string digits = token.text;
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    digits.append(scale - *places, '0');
    long long value = 0;
    for (char digit : digits)
    {
        value = value * 10 + (digit - '0');
        if (value > INT_MAX)
        {
            throw MalformedInputError(token.line, "value '" + token.text + "' too large after scaling by 10^" +
                                                      std::to_string(scale));
        }
    }
    return static_cast<int>(value);
}

Instance Parser::buildInstance(std::string name, const Token &capacity, const std::vector<Token> &sizes,
                               std::optional<int> knownOptimalBins, int scale)
{
    Instance instance;
    instance.name = std::move(name);
    instance.knownOptimalBins = knownOptimalBins;
    instance.capacity = scaleToken(capacity, scale);
    if (instance.capacity == 0)
    {
        throw MalformedInputError(capacity.line, "capacity must be > 0 in instance '" + instance.name + "'");
    }
    instance.sizes.reserve(sizes.size());
    for (const auto &token : sizes)
    {
        const int size = scaleToken(token, scale);
        if (size == 0)
        {
            throw MalformedInputError(token.line, "item sizes must be > 0 in instance '" + instance.name + "'");
        }
        if (size > instance.capacity)
        {
            throw InfeasibleItemError("line " + std::to_string(token.line) + ": item " +
                                      std::to_string(instance.sizes.size() + 1) + " of instance '" +
                                      instance.name + "' has size " + std::to_string(size) +
                                      " > capacity " + std::to_string(instance.capacity));
        }
        instance.sizes.push_back(size);
    }
    return instance;
}

std::vector<Instance> Parser::parseSimple(const std::vector<Token> &tokens, const std::string &stem)
{
    if (tokens.size() < 2)
    {
        throw MalformedInputError(tokens[0].line, "expected a header with n and capacity");
    }
    const std::size_t remaining = tokens.size() - 2;
    auto declaresRemaining = [remaining](const Token &token) {
        const auto places = decimalPlaces(token.text);
        return places && *places == 0 && token.text[0] != '-' && token.text.size() <= 9 &&
               static_cast<std::size_t>(std::stoi(token.text)) == remaining;
    };

    // n capacity first, capacity n only if the count does not fit. If both fit
    // the two values are equal and describe the same instance
    const bool nFirst = declaresRemaining(tokens[0]);
    const bool capacityFirst = !nFirst && declaresRemaining(tokens[1]);
    if (!nFirst && !capacityFirst)
    {
        throw MalformedInputError(tokens[0].line, "item count mismatch: header '" + tokens[0].text + " " +
                                                      tokens[1].text + "' declares n=" + tokens[0].text +
                                                      " (or n=" + tokens[1].text + ") but found " +
                                                      std::to_string(remaining) + " size tokens");
    }
    if (remaining == 0)
    {
        throw MalformedInputError(tokens[0].line, "instance has no items");
    }

    const Token &capacity = nFirst ? tokens[1] : tokens[0];
    std::vector<Token> sizes(tokens.begin() + 2, tokens.end());
    std::vector<Token> scaled = sizes;
    scaled.push_back(capacity);
    const int scale = detectScale(scaled);

    return {buildInstance(stem, capacity, sizes, std::nullopt, scale)};
}

std::vector<Instance> Parser::parseBinPack(const std::vector<std::vector<Token>> &lines, const std::string &stem)
{
    struct RawInstance
    {
        std::string name;
        Token capacity;
        std::vector<Token> sizes;
        std::optional<int> knownOptimalBins;
    };

    if (lines[0].size() != 1)
    {
        throw MalformedInputError(lines[0][0].line, "expected the instance count alone on the first line");
    }
    const int numInstances = parseCount(lines[0][0], "instance count");
    if (numInstances == 0)
    {
        throw MalformedInputError(lines[0][0].line, "instance count must be > 0");
    }
    const std::size_t lastLine = lines.back().back().line;

    std::vector<RawInstance> raw;
    std::size_t idx = 1;
    for (int k = 0; k < numInstances; k++)
    {
        if (idx >= lines.size())
        {
            throw MalformedInputError(lastLine, "unexpected end of input, expected instance " + std::to_string(k + 1) +
                                                    " of " + std::to_string(numInstances));
        }
        const auto &nameLine = lines[idx++];
        if (nameLine.size() != 1 || isNumeric(nameLine[0]))
        {
            throw MalformedInputError(nameLine[0].line, "expected an instance name token, got '" + nameLine[0].text + "'");
        }
        RawInstance instance{nameLine[0].text, {}, {}, std::nullopt};

        if (idx >= lines.size())
        {
            throw MalformedInputError(lastLine, "unexpected end of input after instance name '" + instance.name + "'");
        }
        const auto &header = lines[idx++];
        if (header.size() < 2 || header.size() > 3)
        {
            throw MalformedInputError(header[0].line, "header of instance '" + instance.name +
                                                          "' must be 'capacity n [opt]'");
        }
        if (!isNumeric(header[0]))
        {
            throw MalformedInputError(header[0].line, "non-numeric capacity '" + header[0].text + "'");
        }
        instance.capacity = header[0];
        const int n = parseCount(header[1], "item count");
        if (n == 0)
        {
            throw MalformedInputError(header[1].line, "instance '" + instance.name + "' has no items");
        }
        if (header.size() == 3)
        {
            const int opt = parseCount(header[2], "optimal bin count");
            if (opt == 0)
            {
                throw MalformedInputError(header[2].line, "optimal bin count must be > 0");
            }
            instance.knownOptimalBins = opt;
        }

        const std::size_t declared = static_cast<std::size_t>(n);
        while (instance.sizes.size() < declared)
        {
            if (idx >= lines.size())
            {
                throw MalformedInputError(lastLine, "instance '" + instance.name + "' declares n=" + std::to_string(n) +
                                                        " but found " + std::to_string(instance.sizes.size()) +
                                                        " size tokens");
            }
            for (const auto &token : lines[idx])
            {
                if (!isNumeric(token))
                {
                    throw MalformedInputError(token.line, "non-numeric size token '" + token.text + "' in instance '" +
                                                              instance.name + "' (declared n=" + std::to_string(n) +
                                                              ", read " + std::to_string(instance.sizes.size()) + ")");
                }
                if (instance.sizes.size() == declared)
                {
                    throw MalformedInputError(token.line, "instance '" + instance.name + "' declares n=" +
                                                              std::to_string(n) + " but more size tokens are present");
                }
                instance.sizes.push_back(token);
            }
            idx++;
        }
        raw.push_back(std::move(instance));
    }
    if (idx < lines.size())
    {
        throw MalformedInputError(lines[idx][0].line, "unexpected content after " + std::to_string(numInstances) +
                                                          " instances: '" + lines[idx][0].text + "'");
    }

    // one scale for the whole file
    std::vector<Token> scaled;
    for (const auto &instance : raw)
    {
        scaled.push_back(instance.capacity);
        scaled.insert(scaled.end(), instance.sizes.begin(), instance.sizes.end());
    }
    const int scale = detectScale(scaled);

    std::vector<Instance> instances;
    instances.reserve(raw.size());
    for (const auto &instance : raw)
    {
        instances.push_back(buildInstance(stem + "_" + instance.name, instance.capacity, instance.sizes,
                                          instance.knownOptimalBins, scale));
    }
    return instances;
}

}
