// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobKV/Core/ResultChannel.hpp"

#include <algorithm>
#include <stdexcept>
namespace BlobKV::Core
{
    ResultChannel::ResultChannel(const size_t capacity)
        : m_capacity(std::max<size_t>(capacity, 1)), m_closed(false), m_cancelled(false)
    {
    }

    bool ResultChannel::Push(Result result)
    {
        std::unique_lock lock(m_mutex);
        if (m_closed)
        {
            throw std::logic_error("Push on a closed result channel");
        }

        m_notFull.wait(lock, [this]()
            {
                return m_cancelled || m_buffer.size() < m_capacity;
            });
        if (m_cancelled)
        {
            return false;
        }

        m_buffer.push_back(std::move(result));
        lock.unlock();
        m_notEmpty.notify_one();
        return true;
    }

    std::optional<Result> ResultChannel::Pop()
    {
        std::unique_lock lock(m_mutex);
        m_notEmpty.wait(lock, [this]()
            {
                return m_cancelled || m_closed || !m_buffer.empty();
            });
        if (m_cancelled || m_buffer.empty())
        {
            return std::nullopt;
        }

        auto result = std::move(m_buffer.front());
        m_buffer.pop_front();
        lock.unlock();
        m_notFull.notify_one();
        return result;
    }

    void ResultChannel::Close()
    {
        {
            std::scoped_lock lock(m_mutex);
            if (m_closed)
            {
                throw std::logic_error("Result channel closed more than once");
            }

            m_closed = true;
        }

        m_notEmpty.notify_all();
    }

    void ResultChannel::Cancel()
    {
        {
            std::scoped_lock lock(m_mutex);
            m_cancelled = true;
            m_buffer.clear();
        }

        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    bool ResultChannel::IsCancelled()
    {
        std::scoped_lock lock(m_mutex);
        return m_cancelled;
    }

    ChannelResults::ChannelResults(Core::Query query, const size_t bufferSize, Producer producer)
        : m_query(std::move(query)),
        m_channel(std::make_shared<ResultChannel>(bufferSize)),
        m_producer([channel = m_channel, producer = std::move(producer)](std::stop_token stopToken)
            {
                try
                {
                    producer(stopToken, *channel);
                }
                catch (const std::exception&)
                {
                    // A producer that escapes with an exception still ends the stream with it.
                    (void)channel->Push(Result{ .Error = std::current_exception() });
                }

                channel->Close();
            })
    {
    }

    ChannelResults::~ChannelResults()
    {
        Close();
    }

    const Core::Query& ChannelResults::GetQuery() const noexcept
    {
        return m_query;
    }

    std::optional<Result> ChannelResults::Next()
    {
        return m_channel->Pop();
    }

    void ChannelResults::Close()
    {
        m_producer.request_stop();
        m_channel->Cancel();
        if (m_producer.joinable())
        {
            m_producer.join();
        }
    }
}
