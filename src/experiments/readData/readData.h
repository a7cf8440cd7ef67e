#ifndef Parser_H
#define Parser_H

#include "bpp/Structs/structCollection.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bpp {

/**
 * @brief reads the simple (n capacity / capacity n) and the BinPack multi
 * instance layout, decimal values are scaled by one power of ten per file
 */
class Parser
{
    public:
        struct Token {
            std::string text;
            std::size_t line;
        };

        Parser(){};

        std::vector<Instance> readInstances(const std::string &filename);
        std::vector<Instance> parse(const std::string &content, const std::string &stem);

        /**
         * @brief number of fractional digits, nullopt if the token is not a number
         */
        static std::optional<int> decimalPlaces(const std::string &token);
        /**
         * @brief largest number of fractional digits of the tokens (the file scale is 10^result)
         */
        static int detectScale(const std::vector<Token> &tokens);
        static int scaleToken(const Token &token, int scale);

    private:
        std::vector<Instance> parseSimple(const std::vector<Token> &tokens, const std::string &stem);
        std::vector<Instance> parseBinPack(const std::vector<std::vector<Token>> &lines, const std::string &stem);
        static Instance buildInstance(std::string name, const Token &capacity, const std::vector<Token> &sizes,
                                      std::optional<int> knownOptimalBins, int scale);
};

}
#endif
