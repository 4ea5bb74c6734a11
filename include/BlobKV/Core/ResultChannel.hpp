// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobKV/Core/Results.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
namespace BlobKV::Core
{
    /// <summary>
    /// Bounded queue feeding query results from any number of producers to a single consumer.
    ///
    /// The owner of the producers closes the channel exactly once, after every producer has finished.
    /// Cancelling is the consumer's way out: it drops buffered results and releases blocked producers.
    /// </summary>
    class ResultChannel
    {
        std::mutex m_mutex;
        std::condition_variable m_notEmpty;
        std::condition_variable m_notFull;
        std::deque<Result> m_buffer;
        size_t m_capacity;
        bool m_closed;
        bool m_cancelled;

    public:
        explicit ResultChannel(size_t capacity);
        ResultChannel(const ResultChannel&) = delete;
        ResultChannel& operator=(const ResultChannel&) = delete;
        ResultChannel(ResultChannel&&) = delete;
        ResultChannel& operator=(ResultChannel&&) = delete;

        /// <summary>
        /// Blocks while the buffer is full.
        /// </summary>
        /// <returns>false if the consumer cancelled; the result is dropped.</returns>
        /// <exception cref="std::logic_error">The channel is already closed.</exception>
        [[nodiscard]] bool Push(Result result);

        /// <returns>The next result, or std::nullopt once closed and drained or once cancelled.</returns>
        [[nodiscard]] std::optional<Result> Pop();

        /// <exception cref="std::logic_error">The channel is already closed.</exception>
        void Close();
        void Cancel();
        [[nodiscard]] bool IsCancelled();
    };

    /// <summary>
    /// Results backed by a ResultChannel and a producer thread. The channel is closed once the
    /// producer returns. Closing the results requests stop, cancels the channel and joins the producer.
    /// </summary>
    class ChannelResults final : public Results
    {
    public:
        using Producer = std::function<void(std::stop_token, ResultChannel&)>;

    private:
        Core::Query m_query;
        std::shared_ptr<ResultChannel> m_channel;
        std::jthread m_producer;

    public:
        ChannelResults(Core::Query query, size_t bufferSize, Producer producer);
        virtual ~ChannelResults() override;
        ChannelResults(const ChannelResults&) = delete;
        ChannelResults& operator=(const ChannelResults&) = delete;
        ChannelResults(ChannelResults&&) = delete;
        ChannelResults& operator=(ChannelResults&&) = delete;

        [[nodiscard]] virtual const Core::Query& GetQuery() const noexcept override;
        [[nodiscard]] virtual std::optional<Result> Next() override;
        virtual void Close() override;
    };
}
