/***
$ c++ -std=c++17 -Wall -Wextra -I. lazyjson_example.cpp -o lazyjson_example
$ ./lazyjson_example
Houston Astros 3
Seattle Mariners 5
Seattle Mariners 2
Oakland Athletics 1
 ***/

#include "lazyjson_reader.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

static const char scoreboard[] =
    "{ \"leagues\": [ { \"name\": \"Major League Baseball\", \"season\": { \"year\": 2023 } } ], "
    "\"events\": [ "
    "{ \"name\": \"Seattle Mariners at Houston Astros\", \"competitions\": [ { \"venue\": "
    "{ \"fullName\": \"Minute Maid Park\" }, \"competitors\": [ "
    "{ \"homeAway\": \"home\", \"team\": { \"displayName\": \"Houston Astros\" }, \"score\": \"3\" }, "
    "{ \"homeAway\": \"away\", \"team\": { \"displayName\": \"Seattle Mariners\" }, \"score\": \"5\" } "
    "] } ] }, "
    "{ \"name\": \"New York Yankees at Boston Red Sox\", \"competitions\": [ { \"venue\": "
    "{ \"fullName\": \"Fenway Park\" }, \"competitors\": [ "
    "{ \"homeAway\": \"home\", \"team\": { \"displayName\": \"Boston Red Sox\" }, \"score\": \"4\" }, "
    "{ \"homeAway\": \"away\", \"team\": { \"displayName\": \"New York Yankees\" }, \"score\": \"7\" } "
    "] } ] }, "
    "{ \"name\": \"Oakland Athletics at Seattle Mariners\", \"competitions\": [ { \"venue\": "
    "{ \"fullName\": \"T-Mobile Park\" }, \"competitors\": [ "
    "{ \"homeAway\": \"home\", \"team\": { \"displayName\": \"Seattle Mariners\" }, \"score\": \"2\" }, "
    "{ \"homeAway\": \"away\", \"team\": { \"displayName\": \"Oakland Athletics\" }, \"score\": \"1\" } "
    "] } ] } "
    "] }";

int main()
{
    std::vector<std::pair<std::string, long>> scores;

    try
    {
        // Hands the document out 32 bytes at a time, the way a chunked HTTP
        // response body would arrive
        std::string_view remaining(scoreboard, sizeof(scoreboard) - 1);
        lazyjson::function_source source([&]
        {
            const std::string chunk(remaining.substr(0, 32));
            remaining.remove_prefix(chunk.size());
            return chunk;
        });

        //=================================
        lazyjson::value json_data = lazyjson::load(source);
        for (const lazyjson::value& event : json_data["events"].as_array())
        {
            if (event["name"].as<std::string_view>().find("Seattle") ==
                std::string_view::npos)
            {
                continue;
            }

            for (const lazyjson::value& competition :
                event["competitions"].as_array())
            {
                for (const lazyjson::value& competitor :
                    competition["competitors"].as_array())
                {
                    std::string name =
                        competitor["team"]["displayName"].as<std::string>();
                    const long score =
                        std::stol(competitor["score"].as<std::string>());

                    std::cout << name << " " << score << std::endl;
                    scores.emplace_back(std::move(name), score);
                }
            }
        }
        //=================================
    }
    catch (std::exception& e)
    {
        std::cerr << "EXCEPTION: " << e.what() << std::endl;
        return -1;
    }

    //=================================
    const std::vector<std::pair<std::string, long>> expected = {
        {"Houston Astros", 3},
        {"Seattle Mariners", 5},
        {"Seattle Mariners", 2},
        {"Oakland Athletics", 1},
    };
    assert(scores == expected);
    //=================================

    return 0;
}
