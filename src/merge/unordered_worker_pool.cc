#include "unordered_worker_pool.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <glog/logging.h>

namespace Braid{

struct UnorderedWorkerPool::RunState {
	RunState(const std::vector<MergeSource>& srcs, size_t capacity,
			const CancellationToken* cancel, const ErrorCallback& callback):
		sources(srcs),
		jobs(std::max<size_t>(srcs.size(), 1)),
		hand_off(capacity),
		stop(cancel),
		on_error(callback){}

	const std::vector<MergeSource>& sources;
	folly::MPMCQueue<size_t> jobs;
	HandOffQueue hand_off;
	// Cancelled by the caller's token, or by the writer when the destination fails
	CancellationToken stop;
	std::atomic<int> finished_workers{0};
	const ErrorCallback& on_error;
};

namespace {

void JoinAll(std::vector<std::thread>& threads){
	for(std::thread& thread : threads){
		if(thread.joinable()){
			thread.join();
		}
	}
}

} // namespace

	UnorderedWorkerPool::UnorderedWorkerPool(RecordFilter* filter, int worker_count,
			size_t queue_capacity, std::chrono::milliseconds poll_interval):
		filter_(filter),
		worker_count_(worker_count),
		queue_capacity_(queue_capacity),
		poll_interval_(poll_interval){
			if(worker_count_ < 1){
				throw ConfigurationError("Concurrent merge needs at least one worker, got " + std::to_string(worker_count_));
			}
			if(queue_capacity_ < 1){
				throw ConfigurationError("Hand-off queue capacity must be at least 1");
			}
			if(poll_interval_.count() < 1){
				poll_interval_ = std::chrono::milliseconds(1);
			}
		}

	UnorderedWorkerPool::Result UnorderedWorkerPool::Run(const std::vector<MergeSource>& sources,
			RecordSink& sink, const CancellationToken* cancel, const ErrorCallback& on_error){
		if(!on_error){
			throw ConfigurationError("Concurrent merge requires an error callback");
		}

		RunState state(sources, queue_capacity_, cancel, on_error);
		for(size_t i = 0; i < sources.size(); i++){
			state.jobs.blockingWrite(i);
		}

		std::vector<std::thread> threads;
		threads.reserve(worker_count_);
		Result result;
		try{
			for(int i = 0; i < worker_count_; i++){
				threads.emplace_back(&UnorderedWorkerPool::WorkerLoop, this, std::ref(state));
			}
			VLOG(1) << "[UnorderedWorkerPool]: " << worker_count_ << " workers draining "
				<< sources.size() << " sources";
			result.records_written = WriterLoop(state, sink, result.cancelled);
		}catch(...){
			// Release workers blocked on a full hand-off queue before joining, then propagate
			state.stop.Cancel();
			JoinAll(threads);
			throw;
		}

		JoinAll(threads);

		VLOG(1) << "[UnorderedWorkerPool]: wrote " << result.records_written << " records"
			<< (result.cancelled ? " before cancellation" : "");
		return result;
	}

	void UnorderedWorkerPool::WorkerLoop(RunState& state){
		size_t index;
		while(!state.stop.IsCancelled() && state.jobs.read(index)){
			DrainSource(state, state.sources[index]);
		}

		// The last worker out closes the hand-off queue
		if(state.finished_workers.fetch_add(1) + 1 == worker_count_){
			if(!EnqueueRecord(state.hand_off, std::nullopt, state.stop, poll_interval_)){
				VLOG(1) << "[UnorderedWorkerPool]: run stopped before the hand-off queue was closed";
			}
		}
	}

	void UnorderedWorkerPool::DrainSource(RunState& state, const MergeSource& source){
		try{
			if(!source.open){
				throw SourceAccessError(source.label, "source " + source.label + " cannot be opened");
			}
			std::unique_ptr<LineReader> reader = source.open();
			std::string line;
			std::string error;
			while(!state.stop.IsCancelled() && reader->Next(line)){
				if(filter_ != nullptr){
					error.clear();
					Action action = filter_->Filter(source.label, line, error);
					if(action == Action::kSkip){
						continue;
					}
					if(action == Action::kStop){
						throw HandlerAbortError(source.label, error);
					}
				}
				if(!EnqueueRecord(state.hand_off, std::move(line), state.stop, poll_interval_)){
					return;
				}
			}
		}catch(const MergeError& e){
			LOG(ERROR) << "[UnorderedWorkerPool]: " << KindName(e.kind()) << " on " << source.label << ": " << e.what();
			state.on_error(e);
		}catch(const std::exception& e){
			// Anything else thrown while draining (a filter, an allocation) ends only this source
			LOG(ERROR) << "[UnorderedWorkerPool]: draining " << source.label << " failed: " << e.what();
			state.on_error(HandlerAbortError(source.label, e.what()));
		}
	}

	uint64_t UnorderedWorkerPool::WriterLoop(RunState& state, RecordSink& sink, bool& cancelled){
		uint64_t written = 0;
		while(true){
			std::optional<std::string> item;
			if(!DequeueRecord(state.hand_off, item, state.stop, poll_interval_)){
				// Undelivered records stay in the queue and are dropped with it
				cancelled = true;
				return written;
			}
			if(!item.has_value()){
				return written;
			}
			sink.WriteRecord(*item);
			sink.Flush();
			written++;
		}
	}

} // End of namespace Braid
