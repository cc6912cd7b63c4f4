#include <iostream>
#include <ckcore/path.hh>
#include <ckiso/const.hh>
#include <ckiso/imagestore.hh>
#include <ckiso/iso9660reader.hh>
#include "log.hh"

int main(int argc,const char *argv[])
{
    // Validate the arguments.
    if (argc != 2)
    {
        std::cerr << "Usage: ckisols <image>" << std::endl;
        return 1;
    }

    ckcore::Path image_path(argv[1]);
    ckiso::FileImageStore store(image_path);
    if (!store.open(ckiso::FileImageStore::MODE_READ))
    {
        std::cerr << "Error: Could not open the disc image." << std::endl;
        return 1;
    }

    Log log;
    ckiso::LogListing listing(log);
    ckiso::Iso9660Reader reader(log);

    switch (reader.read(store,listing))
    {
        case RESULT_OK:
            return 0;

        case RESULT_NO_PVD:
            std::cerr << "Error: The file is not an ISO9660 disc image." << std::endl;
            return 1;

        case RESULT_MALFORMED:
            std::cerr << "Error: The disc image is corrupt." << std::endl;
            return 1;

        default:
            std::cerr << "Error: Failed to read the disc image." << std::endl;
            return 1;
    }
}
