#include "downloader.h"


int main(int argc, char* argv[]){
    install_signal_handlers();
    return txdl_main(argc, argv);
}
