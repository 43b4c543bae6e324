#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: drop_tracker.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Handle устахад resource id-г дараалалд нэмнэ. Бодит устгалтыг
            Device::clean() л хийнэ. Олон producer (өөр thread-ээс destructor),
            нэг consumer (render thread).
*/


#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "ngfx/gfx/resource_id.hpp"

namespace ngfx
{
    class DropTracker
    {
    public:
        void push(ResourceId id)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            dropped_.push_back(id);
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return dropped_.empty();
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return dropped_.size();
        }

        // Swap the whole queue out so each id is handed over exactly once.
        std::vector<ResourceId> take_all()
        {
            std::vector<ResourceId> out{};
            {
                std::lock_guard<std::mutex> lock(mtx_);
                out.swap(dropped_);
            }
            return out;
        }

    private:
        mutable std::mutex mtx_{};
        std::vector<ResourceId> dropped_{};
    };

    namespace detail
    {
        // Handle-ийн бүх хуулбар нэг ResourceRef-ийг хуваалцана.
        // Сүүлийн хуулбар устахад нэг л удаа дараалалд орно.
        class ResourceRef
        {
        public:
            ResourceRef(ResourceId id, std::shared_ptr<DropTracker> tracker)
                : id_(id), tracker_(std::move(tracker))
            {}

            ~ResourceRef()
            {
                if (tracker_) tracker_->push(id_);
            }

            ResourceRef(const ResourceRef&) = delete;
            ResourceRef& operator=(const ResourceRef&) = delete;

            const ResourceId& id() const { return id_; }

        private:
            ResourceId id_{};
            std::shared_ptr<DropTracker> tracker_{};
        };

        inline std::shared_ptr<const ResourceRef> make_resource_ref(ResourceId id, std::shared_ptr<DropTracker> tracker)
        {
            return std::make_shared<const ResourceRef>(id, std::move(tracker));
        }
    }
}
