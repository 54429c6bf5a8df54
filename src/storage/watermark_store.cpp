#include <stdexcept>

#include "relaysync/storage/watermark_store.hpp"

using namespace relaysync::storage;
using namespace std;

WatermarkStore::WatermarkStore(shared_ptr<IPersistence> persistence)
: _persistence(persistence)
{
    if (this->_persistence == nullptr)
    {
        throw invalid_argument("WatermarkStore::WatermarkStore: A persistence store is required.");
    }
};

time_t WatermarkStore::get(const string& name) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_read(name);
};

bool WatermarkStore::advance(const string& name, time_t timestamp)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    if (timestamp <= this->_read(name))
    {
        return false;
    }

    this->_persistence->set(KEY_PREFIX + name, to_string(timestamp));
    PLOG_VERBOSE << "Advanced watermark " << name << " to " << timestamp;

    return true;
};

string WatermarkStore::peerKey(const string& peerPubkey)
{
    return MESSAGES + ":" + peerPubkey;
};

time_t WatermarkStore::_read(const string& name) const
{
    auto value = this->_persistence->get(KEY_PREFIX + name);
    if (!value.has_value())
    {
        return 0;
    }

    try
    {
        return static_cast<time_t>(stoll(*value));
    }
    catch (const logic_error& le)
    {
        PLOG_WARNING << "Ignoring unreadable watermark " << name << ": " << le.what();
        return 0;
    }
};
