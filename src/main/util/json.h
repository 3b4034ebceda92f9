#ifndef WALKPLAN_JSON_H
#define WALKPLAN_JSON_H

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <boost/date_time.hpp>

namespace walkplan {

    class JsonLoader {

    protected:
        std::domain_error OnKeyNotFound(std::string key) const;

        std::domain_error OnInvalidValue(std::string key, std::string reason) const;

        template<typename JsonType>
        const JsonType &Require(const JsonType &document, const std::string &key) const;
    };
}

namespace walkplan {

    template<typename JsonType>
    const JsonType &JsonLoader::Require(const JsonType &document, const std::string &key) const {
        const auto value_it = document.find(key);
        if (value_it == std::end(document)) { throw OnKeyNotFound(key); }
        return value_it.value();
    }
}

namespace boost {

    namespace posix_time {

        void to_json(nlohmann::json &json, const ptime &value);

        void from_json(const nlohmann::json &json, ptime &value);

        void to_json(nlohmann::json &json, const time_duration &value);

        void from_json(const nlohmann::json &json, time_duration &value);
    }
}


#endif //WALKPLAN_JSON_H
