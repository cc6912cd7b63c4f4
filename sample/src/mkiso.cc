#include <iostream>
#include <ckcore/directory.hh>
#include <ckcore/path.hh>
#include <ckiso/const.hh>
#include <ckiso/imagestore.hh>
#include <ckiso/sourcetree.hh>
#include <ckiso/iso9660writer.hh>
#include "progress.hh"
#include "log.hh"

int main(int argc,const char *argv[])
{
    // Validate the arguments.
    if (argc < 3 || argc > 4)
    {
        std::cerr << "Usage: ckisomk <source directory> <image> [volume label]" << std::endl;
        return 1;
    }

    const ckcore::tchar *base_path = argv[1];
    if (!ckcore::Directory::exist(ckcore::Path(base_path)))
    {
        std::cerr << "Error: The specified folder does not exist." << std::endl;
        return 1;
    }

    ckcore::Path image_path(argv[2]);
    ckiso::FileImageStore store(image_path);
    if (!store.open(ckiso::FileImageStore::MODE_WRITE))
    {
        std::cerr << "Error: Could not open output file for writing." << std::endl;
        return 1;
    }

    std::cout << "Writing disc image." << std::endl;

    Progress progress;
    Log log;

    ckiso::DiskSourceTree source(base_path);
    ckiso::Iso9660Writer writer(log);
    writer.set_volume_label(argc == 4 ? argv[3] : ckT("CDROM"));
    writer.set_text_fields(ckT("LINUX"),ckT(""),ckT(""),ckT("CKISO " CKISO_VERSION));

    int res = writer.write(source,store,progress);
    store.close();

    if (res != RESULT_OK)
    {
        std::cerr << "Error: Failed to create disc image." << std::endl;
        return 1;
    }

    return 0;
}
