#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "common.hpp"


namespace quizpager
{
/**
 * Function evaluations can be given to a ThreadPool instance,
 * which assigns the evaluation to one of its threads to be evaluated in parallel.
 * Threads are spawned lazily on submission and joined on @ref stop or destruction.
 */
class ThreadPool
{
public:
    /** Lower values are processed first. */
    enum Priority : int
    {
        HIGH = -1,
        NORMAL = 0,
    };

private:
    /**
     * A small type-erasure function wrapper for non-copyable function objects with no function arguments.
     * std::function<void()> won't work to wrap std::packaged_task
     * because the former requires a copy-constructible object, which the latter is not.
     * @see http://www.open-std.org/jtc1/sc22/wg21/docs/lwg-defects.html#1287
     */
    class PackagedTaskWrapper
    {
    private:
        struct BaseFunctor
        {
            virtual void
            operator()() = 0;

            virtual
            ~BaseFunctor() = default;
        };

        template<class T_Functor>
        struct SpecializedFunctor :
            BaseFunctor
        {
            explicit
            SpecializedFunctor( T_Functor&& functor ) :
                m_functor( std::move( functor ) )
            {}

            void
            operator()() override
            {
                m_functor();
            }

        private:
            T_Functor m_functor;
        };

    public:
        template<class T_Functor, std::enable_if_t<std::is_invocable_v<T_Functor>, void>* = nullptr>
        explicit
        PackagedTaskWrapper( T_Functor&& functor ) :
            m_impl( std::make_unique<SpecializedFunctor<T_Functor> >( std::forward<T_Functor>( functor ) ) )
        {}

        void
        operator()()
        {
            ( *m_impl )();
        }

    private:
        std::unique_ptr<BaseFunctor> m_impl;
    };

    struct QueuedTask
    {
        /** Lets @ref promote find the task again. */
        std::optional<size_t> tag;
        PackagedTaskWrapper task;
    };

    /** Similar to C++20 std::jthread, joins in the destructor. */
    class JoiningThread
    {
    public:
        template<class Function>
        explicit
        JoiningThread( Function&& function ) :
            m_thread( std::forward<Function>( function ) )
        {}

        JoiningThread( JoiningThread&& ) = default;

        JoiningThread( const JoiningThread& ) = delete;

        JoiningThread&
        operator=( JoiningThread&& ) = delete;

        JoiningThread&
        operator=( const JoiningThread& ) = delete;

        ~JoiningThread()
        {
            if ( m_thread.joinable() ) {
                m_thread.join();
            }
        }

    private:
        std::thread m_thread;
    };

public:
    explicit
    ThreadPool( size_t threadCount = availableCores() ) :
        m_threadCount( std::max<size_t>( 1U, threadCount ) )
    {
        m_threads.reserve( m_threadCount );
    }

    ~ThreadPool()
    {
        stop();
    }

    ThreadPool( const ThreadPool& ) = delete;

    ThreadPool&
    operator=( const ThreadPool& ) = delete;

    /**
     * Waits for the currently running tasks to finish and joins all threads.
     * Tasks that have not been started yet are dropped, i.e., their futures will report a broken promise.
     */
    void
    stop()
    {
        {
            const std::lock_guard lock( m_mutex );
            m_threadPoolRunning = false;
            m_pingWorkers.notify_all();
        }

        m_threads.clear();

        const std::lock_guard lock( m_mutex );
        m_tasks.clear();
    }

    /**
     * Any function taking no arguments and returning any argument may be submitted to be executed.
     * The returned future can be used to access the result when it is really needed.
     * @param priority Tasks are processed ordered by their priority, i.e., tasks with priority 0
     *        are processed only after all tasks with priority -1 have been processed.
     * @param tag Optional key with which the task can be promoted while it is still queued.
     */
    template<class T_Functor, std::enable_if_t<std::is_invocable_v<T_Functor>, void>* = nullptr>
    std::future<decltype( std::declval<T_Functor>()() )>
    submit( T_Functor&&           task,
            int                   priority = NORMAL,
            std::optional<size_t> tag = {} )
    {
        const std::lock_guard lock( m_mutex );

        if ( !m_threadPoolRunning ) {
            throw std::logic_error( "Cannot submit tasks to a stopped thread pool!" );
        }

        /* Use a packaged task, which abstracts handling the return type and makes the task return void. */
        using ReturnType = decltype( std::declval<T_Functor>()() );
        std::packaged_task<ReturnType()> packagedTask{ std::forward<T_Functor>( task ) };
        auto resultFuture = packagedTask.get_future();
        m_tasks[priority].push_back( QueuedTask{ tag, PackagedTaskWrapper( std::move( packagedTask ) ) } );

        if ( ( m_threads.size() < m_threadCount ) && ( m_idleThreadCount == 0 ) ) {
            spawnThread();
        }

        m_pingWorkers.notify_one();

        return resultFuture;
    }

    /**
     * Drops all tasks with the given priority that have not been started yet.
     * Their futures will report a broken promise.
     * @return The number of dropped tasks.
     */
    size_t
    discardQueuedTasks( int priority )
    {
        const std::lock_guard lock( m_mutex );
        const auto tasks = m_tasks.find( priority );
        if ( tasks == m_tasks.end() ) {
            return 0;
        }

        const auto count = tasks->second.size();
        m_tasks.erase( tasks );
        return count;
    }

    /**
     * Moves the oldest queued task with the given tag and a lower priority than @p priority
     * to the end of the queue for @p priority.
     * @return false if there is no such task, e.g., because it has already been started.
     */
    bool
    promote( size_t tag,
             int    priority )
    {
        const std::lock_guard lock( m_mutex );
        for ( auto tasks = m_tasks.upper_bound( priority ); tasks != m_tasks.end(); ++tasks ) {
            auto& queue = tasks->second;
            const auto match = std::find_if( queue.begin(), queue.end(),
                                             [tag] ( const auto& queued ) { return queued.tag == tag; } );
            if ( match != queue.end() ) {
                auto promoted = std::move( *match );
                queue.erase( match );
                m_tasks[priority].push_back( std::move( promoted ) );
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] size_t
    capacity() const
    {
        return m_threadCount;
    }

    [[nodiscard]] size_t
    unprocessedTasksCount( const std::optional<int> priority = {} ) const
    {
        const std::lock_guard lock( m_mutex );
        if ( priority ) {
            const auto tasks = m_tasks.find( *priority );
            return tasks == m_tasks.end() ? 0 : tasks->second.size();
        }
        return std::accumulate( m_tasks.begin(), m_tasks.end(), size_t( 0 ),
                                [] ( size_t sum, const auto& tasks ) { return sum + tasks.second.size(); } );
    }

private:
    /**
     * Does not lock! Therefore it is a private method that should only be called with a lock.
     */
    [[nodiscard]] bool
    hasUnprocessedTasks() const
    {
        return std::any_of( m_tasks.begin(), m_tasks.end(),
                            [] ( const auto& tasks ) { return !tasks.second.empty(); } );
    }

    void
    workerMain()
    {
        while ( m_threadPoolRunning )
        {
            std::unique_lock<std::mutex> tasksLock( m_mutex );
            ++m_idleThreadCount;
            m_pingWorkers.wait( tasksLock, [this] () { return hasUnprocessedTasks() || !m_threadPoolRunning; } );
            --m_idleThreadCount;

            if ( !m_threadPoolRunning ) {
                break;
            }

            const auto nonEmptyTasks = std::find_if( m_tasks.begin(), m_tasks.end(),
                                                     [] ( const auto& tasks ) { return !tasks.second.empty(); } );
            if ( nonEmptyTasks != m_tasks.end() ) {
                auto task = std::move( nonEmptyTasks->second.front().task );
                nonEmptyTasks->second.pop_front();
                tasksLock.unlock();
                task();
            }
        }
    }

    void
    spawnThread()
    {
        m_threads.emplace_back( [this] () { workerMain(); } );
    }

private:
    std::atomic<bool> m_threadPoolRunning = true;

    const size_t m_threadCount;
    std::atomic<size_t> m_idleThreadCount{ 0 };

    /** m_mutex is necessary for m_tasks AND m_pingWorkers or else the notify_all might go unnoticed! */
    std::map</* priority */ int, std::deque<QueuedTask> > m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_pingWorkers;

    /**
     * Should come last so that it's lifetime is the shortest, i.e., there is no danger for the other
     * members to not yet be constructed or be already destructed while a task is still running.
     */
    std::vector<JoiningThread> m_threads;
};
}  // namespace quizpager
