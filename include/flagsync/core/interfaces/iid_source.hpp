/**
 * @file iid_source.hpp
 * @brief Identifier source used for session ids and event insert ids.
 */
#pragma once
#include <string>

namespace flagsync {

    /**
     * @class IIdSource
     * @brief Produces random UUID strings ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
     */
    class IIdSource {
    public:
        virtual ~IIdSource() = default;
        virtual std::string uuid() = 0;
    };

    /**
     * @class RandomIdSource
     * @brief IIdSource backed by a thread-local PRNG.
     */
    class RandomIdSource : public IIdSource {
    public:
        std::string uuid() override;
    };

}
