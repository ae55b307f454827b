#pragma once

#include <string>
#include <functional>
#include <utility>

namespace connector::events {

    /**
     * @brief Base interface for operator request receivers
     */
    class BaseReceiver {
    public:
        using MessageCallback = std::function<void(const std::string &message)>;

        virtual ~BaseReceiver() = default;

        /**
         * @brief Start receiving request lines
         */
        virtual void startReceiving() = 0;

        /**
         * @brief Stop receiving and join the reader thread
         */
        virtual void stopReceiving() = 0;

        /**
         * @brief Check if receiver is actively listening
         */
        virtual bool isReceiving() const = 0;

        /**
         * @brief Get a description of the input the receiver reads
         */
        virtual std::string getSourceName() const = 0;

        /**
         * @brief Get receiver type name
         */
        virtual std::string getReceiverName() const = 0;

        void setMessageCallback(MessageCallback callback) { messageCallback_ = std::move(callback); }

    protected:
        MessageCallback messageCallback_;
    };

}
