#include "relaysync/service/event_deduper.hpp"

using namespace relaysync::data;
using namespace relaysync::service;
using namespace std;

bool EventDeduper::admit(const Event& event)
{
    if (event.id.empty())
    {
        return false;
    }

    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_seenIds.insert(event.id).second;
};

size_t EventDeduper::size() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_seenIds.size();
};
